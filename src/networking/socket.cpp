#include "networking/socket.hpp"
#include "sourceInfo.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace p2ps {

std::string resolveIPv4(const std::string& host) {
    if (host == "localhost")
        return "127.0.0.1";

    struct in_addr addr;
    if (inet_pton(AF_INET, host.c_str(), &addr) == 1)
        return host;

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
        return "";

    char ip[INET_ADDRSTRLEN];
    auto* resolved = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    const char* ok = inet_ntop(AF_INET, &resolved->sin_addr, ip, INET_ADDRSTRLEN);
    freeaddrinfo(res);

    if (!ok)
        return "";
    return std::string(ip);
}

std::optional<std::pair<int, uint16_t>> openSocket(bool       is_server,
                                                   uint16_t   port,
                                                   ErrorCode& err) {
    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    
    //check socket creation
    if (socket_fd < 0) {
        err = ErrorCode::IO_ERROR;
        return std::nullopt;
    }

    if (is_server) {
        //lets a restarted peer reuse its port while old connections linger
        int on = 1;
        setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

        struct sockaddr_in localAddr;
        memset(&localAddr, 0, sizeof(localAddr)); // 0 out struct addr

        localAddr.sin_family        = AF_INET;
        localAddr.sin_port          = htons(port);
        localAddr.sin_addr.s_addr   = INADDR_ANY;
    
        if (bind(socket_fd, (struct sockaddr*)&localAddr, sizeof(localAddr)) < 0) {
            int bind_errno = errno;
            close(socket_fd);
            errno = bind_errno;
            err = ErrorCode::BIND_ERROR;
            return std::nullopt;
        }
    
        socklen_t socket_len = sizeof(localAddr);
        if (getsockname(socket_fd, (struct sockaddr*)&localAddr, &socket_len) < 0) {
            close(socket_fd);
            err = ErrorCode::IO_ERROR;
            return std::nullopt;
        }

        port = ntohs(localAddr.sin_port);

    } else {
        port = 0;
    }

    err = ErrorCode::OK;
    return std::make_pair(socket_fd, port);
}

void closeSocket(int socket_fd) {
    if (socket_fd >= 0)
        close(socket_fd);
}

namespace tcp {

int connect(int                           socket_fd,
            const SourceInfo&             connect_to,
            std::optional<struct timeval> connection_timeout) {
    struct sockaddr_in server_address;
    memset(&server_address, 0, sizeof(server_address)); // 0 out struct addr
    
    server_address.sin_family = AF_INET;
    server_address.sin_port   = htons(connect_to.port);
    if (inet_pton(AF_INET, connect_to.ip_addr.c_str(), &server_address.sin_addr) != 1)
        return -1;
    
    if (!connection_timeout) {
        //blocking connect
        if (::connect(socket_fd, (struct sockaddr*)&server_address, sizeof(server_address)) < 0)
            return -1;
        return EXIT_SUCCESS;
    }

    struct timeval timeout = connection_timeout.value();

    //set non-block
    const int flags = fcntl(socket_fd, F_GETFL);
    if (flags < 0 || fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return -1;

    bool connect_okay = true;
    int res = ::connect(socket_fd, (struct sockaddr *)&server_address, sizeof(server_address));
    if (res < 0 && errno != EINPROGRESS) {
        connect_okay = false;
    } else if (res < 0) {
        fd_set fdset;
        FD_ZERO(&fdset);
        FD_SET(socket_fd, &fdset);

        res = select(socket_fd+1, NULL, &fdset, NULL, &timeout);
        if (res == 1) {
            //socket writable
            int so_err = 0;
            socklen_t len = sizeof(so_err);

            //failed for some reason
            if (getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0 || so_err != 0)
                connect_okay = false;
        } else {
            //timeout or other error
            connect_okay = false;
        }
    }

    fcntl(socket_fd, F_SETFL, flags);

    if (!connect_okay)
        return -1;
    return EXIT_SUCCESS;
}

int listen(int server_fd, int max_pending) {
    if (::listen(server_fd, max_pending) < 0) {
        close(server_fd);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int accept(int server_fd, SourceInfo& client_info) {
    struct sockaddr_in clientAddr;
    socklen_t client_len = sizeof(clientAddr);
    memset(&clientAddr, 0, client_len); // 0 out struct addr

    int client_fd = ::accept(server_fd, (struct sockaddr*)&clientAddr, &client_len);

    if (client_fd < 0) {
        return -1;
    }

    char client_ip[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &clientAddr.sin_addr, client_ip, INET_ADDRSTRLEN))
        client_info.ip_addr = client_ip;
    client_info.port = ntohs(clientAddr.sin_port);
    
    return client_fd;
}

} //tcp

} //p2ps
