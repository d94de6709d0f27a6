#pragma once

#include "config.hpp"

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * run_peer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Main peer startup point. Starts sharing the files in the shared directory
 *    on the configured port, then runs the interactive menu until the user
 *    exits or sends SIGINT. Downloads land in the download directory.
 *
 * Takes:
 * -> config:
 *    Port, directories, and timeouts to run with.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE, the listener couldn't be started.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int run_peer(const Config& config);

} //p2ps
