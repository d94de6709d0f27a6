#include "networking/socketStream.hpp"
#include "networking/internal/sockets/socketUtil.hpp"
#include "networking/socket.hpp"

#include <cstdlib>
#include <sys/socket.h>

namespace p2ps {

SocketStream::SocketStream(int socket_fd) : socket_fd(socket_fd) {}

SocketStream::~SocketStream() {
    close();
}

ssize_t SocketStream::readSome(uint8_t* buffer, size_t len) {
    if (socket_fd < 0)
        return -1;
    return recvBytes(socket_fd, buffer, len);
}

bool SocketStream::writeAll(const uint8_t* data, size_t len) {
    if (socket_fd < 0)
        return false;
    if (len == 0)
        return true;
    return sendBytes(socket_fd, data, len) == EXIT_SUCCESS;
}

void SocketStream::close() {
    if (socket_fd < 0)
        return;

    //send FIN before release so the peer sees a clean end of stream
    shutdown(socket_fd, SHUT_RDWR);
    closeSocket(socket_fd);
    socket_fd = -1;
}

bool SocketStream::isOpen() const {
    return socket_fd >= 0;
}

} //p2ps
