#pragma once

#include "errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <sys/time.h>
#include <sys/types.h>
#include <utility>

namespace p2ps {

struct SourceInfo;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * resolveIPv4
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Turns a host into a dotted IPv4 string. "localhost" maps to 127.0.0.1,
 *    dotted addresses are returned as is, anything else is looked up.
 *
 * Takes:
 * -> host:
 *    The address or host name.
 *
 * Returns:
 * -> On success:
 *    The IPv4 address, ex. "192.168.0.12".
 * -> On failure:
 *    An empty string.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string resolveIPv4(const std::string& host);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * openSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Opens a TCP socket. If is_server is set the socket is bound on all
 *    interfaces at port. If port is 0 the OS assigns an ephemeral port, which
 *    is returned with the socket_fd so it can be handed out.
 *
 * Takes:
 * -> is_server:
 *    A flag to indicate server socket.
 * -> port:
 *    The port to open on, set to 0 if not specified.
 * -> err:
 *    Set on failure. BIND_ERROR if the port couldn't be bound (in use, no
 *    permission), IO_ERROR for anything else.
 *
 * Returns:
 * -> On success:
 *    A pair of the socket fd and the port it was opened on.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::pair<int, uint16_t>> openSocket(bool       is_server,
                                                   uint16_t   port,
                                                   ErrorCode& err);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * closeSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Closes a socket.
 *
 * Takes:
 * -> socket_fd:
 *    The fd of the socket to close.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void closeSocket(int socket_fd);

namespace tcp {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * connect
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Connect a socket to a peer. With a timeout the connect is done
 *    non-blocking and abandoned once the timeout passes. The socket is left
 *    open either way, closing it is up to the caller.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to connect with.
 * -> connect_to:
 *    A struct with info on where to connect. ip_addr must be dotted IPv4.
 * -> connection_timeout:
 *    How long to attempt the connection for. std::nullopt blocks.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int connect(int                           socket_fd,
            const SourceInfo&             connect_to,
            std::optional<struct timeval> connection_timeout=std::nullopt);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * listen
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Start listen for incoming connections. Closes the socket on failure.
 *
 * Takes:
 * -> server_fd:
 *    The server socket to start listening on.
 * -> max_pending:
 *    The max peers that can be waiting to be accepted. Accepted connections
 *    are handed off to a thread immediately so this needn't be high.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int listen(int server_fd, int max_pending);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * accept
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Accept an incoming peer connection. Blocks. errno is left as accept()
 *    set it on failure.
 *
 * Takes:
 * -> server_fd:
 *    Server socket that's listening for an incoming connection.
 * -> client_info:
 *    Filled with the address and port of the connecting peer.
 *
 * Returns:
 * -> On success:
 *    The socket file descriptor of the socket that was opened.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int accept(int server_fd, SourceInfo& client_info);

} //tcp

} //p2ps
