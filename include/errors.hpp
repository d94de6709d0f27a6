#pragma once

#include <cstdint>
#include <string>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ErrorCode
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The result of any listener, session, client, or framing operation. OK is
 *    the only success value. Errors are handed back to the caller of the
 *    operation that produced them, they never cross a session or connection.
 *
 * Values:
 * -> OK:
 *    Success.
 * -> BIND_ERROR:
 *    The listener could not bind its port (in use, no permission).
 * -> CONNECT_ERROR:
 *    An outbound connect timed out or was refused.
 * -> PROTOCOL_ERROR:
 *    An unexpected or malformed line, or the stream ended while a line or a
 *    size header was expected.
 * -> NOT_FOUND_ERROR:
 *    The requested file doesn't exist, locally or on the peer.
 * -> SHORT_READ_ERROR:
 *    A payload ended before its declared size was consumed.
 * -> REMOTE_ERROR:
 *    The peer answered with an ERROR: line other than file not found.
 * -> IO_ERROR:
 *    A socket or file operation failed.
 * -> NOT_CONNECTED:
 *    A client command was issued with no connection.
 * -> INVALID_NAME:
 *    A file name was blank or not a plain name.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
enum class ErrorCode : uint8_t {
    OK = 0,
    BIND_ERROR,
    CONNECT_ERROR,
    PROTOCOL_ERROR,
    NOT_FOUND_ERROR,
    SHORT_READ_ERROR,
    REMOTE_ERROR,
    IO_ERROR,
    NOT_CONNECTED,
    INVALID_NAME,
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * errorName
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Returns a printable name for an ErrorCode, for log lines.
 *
 * Takes:
 * -> code:
 *    The code to name.
 *
 * Returns:
 * -> On success:
 *    The name, ex. "SHORT_READ_ERROR".
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string errorName(ErrorCode code);

} //p2ps
