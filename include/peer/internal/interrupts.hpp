#pragma once

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * blockInterrupts
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Blocks SIGINT in the calling thread. Threads started afterwards inherit
 *    the mask, so call this before starting any workers.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int blockInterrupts();

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * catchInterrupts
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Installs handler for SIGINT and unblocks it in the calling thread only.
 *    No SA_RESTART, so a read blocked in this thread returns on CONTROL+C.
 *
 * Takes:
 * -> handler:
 *    Called on SIGINT. Must be async-signal-safe.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int catchInterrupts(void (*handler)(int));

} //p2ps
