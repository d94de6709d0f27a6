#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * msgLenToBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Writes a length as 8 big-endian bytes.
 *
 * Takes:
 * -> val:
 *    The length to be converted.
 * -> buffer:
 *    Where to store the 8 converted bytes. Caller makes sure 8 bytes fit.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void msgLenToBytes(const uint64_t val, uint8_t* buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * bytesToMsgLen
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads 8 big-endian bytes back into a length.
 *
 * Takes:
 * -> buffer:
 *    Pointer to the first of the 8 bytes.
 *
 * Returns:
 * -> val:
 *    The length in host order.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
uint64_t bytesToMsgLen(const uint8_t* buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sendBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Sends all len bytes through the socket, looping over partial sends. A
 *    peer that went away produces a failure, not a SIGPIPE.
 *
 * Takes:
 * -> socket_fd:
 *    The connected socket.
 * -> data:
 *    The bytes to send.
 * -> len:
 *    How many bytes to send.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int sendBytes(int socket_fd, const uint8_t* data, size_t len);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Blocks until some bytes are available on the socket, then reads at most
 *    try_to_recv of them into buffer.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to read the data from.
 * -> buffer:
 *    Where to store the bytes.
 * -> try_to_recv:
 *    Max bytes to read.
 *
 * Returns:
 * -> On success:
 *    The number of bytes read, 0 if the peer closed the connection.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t recvBytes(int socket_fd, uint8_t* buffer, size_t try_to_recv);

} //p2ps
