#include "networking/internal/sockets/socketUtil.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/socket.h>
#include <sys/types.h>

namespace p2ps {

void msgLenToBytes(const uint64_t val, uint8_t* buffer) {
    uint64_t ordered = toNetworkOrder(val);
    std::memcpy(buffer, &ordered, sizeof(uint64_t));
}

uint64_t bytesToMsgLen(const uint8_t* buffer) {
    uint64_t ordered;
    std::memcpy(&ordered, buffer, sizeof(ordered));
    return fromNetworkOrder(ordered);
}

int sendBytes(int socket_fd, const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t bytes_sent = send(socket_fd, data+sent, len-sent, MSG_NOSIGNAL);
        if (bytes_sent < 0) {
            if (errno == EINTR)
                continue;
            return EXIT_FAILURE;
        }
        sent += bytes_sent;
    }

    return EXIT_SUCCESS;
}

ssize_t recvBytes(int socket_fd, uint8_t* buffer, size_t try_to_recv) {
    if (try_to_recv == 0)
        return -1;

    while (true) {
        ssize_t bytes_read = recv(socket_fd, buffer, try_to_recv, 0);
        if (bytes_read < 0 && errno == EINTR)
            continue;
        return bytes_read;
    }
}

} //p2ps
