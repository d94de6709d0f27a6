#pragma once

#include "errors.hpp"
#include "networking/streams.hpp"
#include "storage/fileStore.hpp"

#include <string>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * handleSession
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Serves exactly one request from a connected peer, then closes the
 *    connection whatever happened. Reads one command line:
 *    -> LIST_FILES:
 *       Replies with the number of files, then one name per line.
 *    -> DOWNLOAD_FILE:
 *       Reads the file name off the next line. Replies OK followed by the
 *       length-prefixed file, or an ERROR: line if there's no such file or
 *       no name, including when the peer stops sending after the command.
 *    -> Anything else:
 *       Replies with an unknown command ERROR: line.
 *    Commands match case-insensitively. If the peer closes before sending a
 *    command, nothing is sent.
 *
 * Takes:
 * -> conn:
 *    The accepted connection. Closed on return.
 * -> store:
 *    The files being shared.
 * -> peer_label:
 *    Who's on the other end, for log lines.
 *
 * Returns:
 * -> On success:
 *    ErrorCode::OK, including when the reply was an ERROR: line or the peer
 *    closed without sending a command.
 * -> On failure:
 *    ErrorCode::IO_ERROR if the reply couldn't be sent.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ErrorCode handleSession(ByteStream&        conn,
                        FileStore&         store,
                        const std::string& peer_label);

} //p2ps
