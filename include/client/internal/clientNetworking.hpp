#pragma once

#include "sourceInfo.hpp"

#include <sys/time.h>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * connectToSource
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Attempts connecting to a IP/port combo specified inside connect_to. The
 *    address may be a host name, it's resolved first. If no connection can be
 *    established within the connection_timeout window, returns an error and
 *    no socket is left open.
 *
 * Takes:
 * -> connect_to:
 *    The peer to connect to.
 * -> connection_timeout:
 *    How long to attempt the connection for.
 *
 * Returns:
 * -> On success:
 *    The connected socket fd.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int connectToSource(const  SourceInfo& connect_to,
                    struct timeval     connection_timeout);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * secondsToTimeval
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Converts a whole number of seconds to a timeval for connectToSource.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct timeval secondsToTimeval(long seconds);

} //p2ps
