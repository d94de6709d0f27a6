#include "client/internal/clientNetworking.hpp"
#include "networking/socket.hpp"

#include <cstdlib>
#include <iostream>

namespace p2ps {

int connectToSource(const  SourceInfo& connect_to,
                    struct timeval     connection_timeout) {
    SourceInfo resolved = connect_to;
    resolved.ip_addr    = resolveIPv4(connect_to.ip_addr);
    if (resolved.ip_addr.empty()) {
        std::cerr << "[connectToSource] Could not resolve " << connect_to.ip_addr << std::endl;
        return -1;
    }

    ErrorCode open_err = ErrorCode::OK;
    auto      sock     = openSocket(false, 0, open_err); //server, port
    if (!sock) return -1;

    if (EXIT_SUCCESS != tcp::connect(sock->first, resolved, connection_timeout)) {
        closeSocket(sock->first);
        return -1;
    }

    return sock->first;
}

struct timeval secondsToTimeval(long seconds) {
    struct timeval tv;
    tv.tv_sec  = seconds;
    tv.tv_usec = 0;
    return tv;
}

} //p2ps
