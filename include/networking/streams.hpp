#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ByteStream
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A bidirectional, connection-like stream of bytes. Sockets implement it
 *    for real traffic, tests implement it over memory.
 *
 * Functions:
 * -> readSome:
 *    Blocks until at least one byte is available, reads at most len of them.
 *    Returns the number read, 0 at end of stream, -1 on error.
 * -> writeAll:
 *    Writes all len bytes. Returns false if that wasn't possible.
 * -> close:
 *    Closes the stream. Calling it again does nothing.
 * -> isOpen:
 *    False once close() was called.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual ssize_t readSome(uint8_t* buffer, size_t len)     = 0;
    virtual bool    writeAll(const uint8_t* data, size_t len) = 0;
    virtual void    close()                                   = 0;
    virtual bool    isOpen() const                            = 0;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ByteSource
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Where an outgoing payload comes from. read() returns the bytes read, 0
 *    once the source is exhausted, -1 on error. Released resources on
 *    destruction.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual ssize_t read(uint8_t* buffer, size_t len) = 0;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ByteSink
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Where an incoming payload goes. Bytes written are not visible under the
 *    destination name until commit() succeeds. discard() drops them, and a
 *    sink destroyed without a commit discards itself.
 *
 * Functions:
 * -> write:
 *    Appends len bytes. False on failure.
 * -> commit:
 *    Publishes the written bytes. EXIT_SUCCESS or EXIT_FAILURE.
 * -> discard:
 *    Throws the written bytes away.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual bool write(const uint8_t* data, size_t len) = 0;
    virtual int  commit()                               = 0;
    virtual void discard()                              = 0;
};

} //p2ps
