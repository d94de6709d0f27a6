#pragma once

#include "networking/streams.hpp"

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * SocketStream
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A ByteStream over a connected TCP socket. Takes ownership of the fd and
 *    closes it when closed or destroyed, so every exit path releases the
 *    socket.
 *
 * Member Variables:
 * -> socket_fd:
 *    The owned socket, -1 once closed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class SocketStream : public ByteStream {
private:
    int socket_fd;

public:
    explicit SocketStream(int socket_fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&)            = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    ssize_t readSome(uint8_t* buffer, size_t len) override;
    bool    writeAll(const uint8_t* data, size_t len) override;
    void    close() override;
    bool    isOpen() const override;

    int fd() const { return socket_fd; }
};

} //p2ps
