#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "sourceInfo.hpp"
#include "storage/fileStore.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <thread>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeerListener
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Accepts incoming peer connections on a TCP port and runs every one in
 *    its own detached session thread serving from store. Stopping the
 *    listener closes the listening socket only, sessions already running
 *    finish on their own. The destructor stops the listener, shuts down the
 *    connections of sessions still running, and waits for them to exit, so
 *    store must outlive it.
 *
 * Member Variables:
 * -> store:
 *    The files sessions serve from.
 * -> listening:
 *    Set while the accept loop is running.
 * -> stopping:
 *    Set by stop() so the accept loop knows a failed accept was expected.
 * -> listen_fd:
 *    The listening socket, -1 when not listening.
 * -> listen_port:
 *    The port actually bound, useful when start() was given 0.
 * -> accept_thread:
 *    Runs acceptLoop().
 * -> lifecycle_mtx:
 *    Serializes start() and stop().
 * -> sessions_mtx, sessions_cv, session_count:
 *    Tracks running sessions for waitForSessions().
 * -> session_watch_fds:
 *    A dup of every running session's socket. Only closed by the session
 *    under sessions_mtx, so the destructor can shut them down safely.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class PeerListener {
private:
    FileStore&              store;
    std::atomic<bool>       listening     = false;
    std::atomic<bool>       stopping      = false;
    int                     listen_fd     = -1;
    std::atomic<uint16_t>   listen_port   = 0;
    std::thread             accept_thread;
    std::mutex              lifecycle_mtx;

    std::mutex              sessions_mtx;
    std::condition_variable sessions_cv;
    size_t                  session_count = 0;
    std::set<int>           session_watch_fds;

    void acceptLoop();
    void runSession(int peer_sock, int watch_fd, SourceInfo peer);
    void endSession(int watch_fd);

    //joins the accept thread and closes listen_fd, lifecycle_mtx held
    void releaseSocket();

    //unblocks every running session, used on destruction
    void abortSessions();

public:
    explicit PeerListener(FileStore& store);
    ~PeerListener();

    PeerListener(const PeerListener&)            = delete;
    PeerListener& operator=(const PeerListener&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Binds port on all interfaces and starts accepting in the background.
     *    Returns once the socket is listening, so connections made after
     *    start() returns are never refused.
     *
     * Takes:
     * -> port:
     *    The port to listen on, 0 for any free port (see port()).
     *
     * Returns:
     * -> On success:
     *    ErrorCode::OK
     * -> On failure:
     *    ErrorCode::BIND_ERROR if the port is in use or not permitted.
     *    ErrorCode::IO_ERROR if already listening or the socket failed.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ErrorCode start(uint16_t port);

    //stops accepting, running sessions are left alone. safe to call twice.
    void stop();

    bool     isListening() const { return listening.load(); }
    uint16_t port() const { return listen_port.load(); }

    size_t activeSessions();

    //blocks until every session started so far has finished
    void waitForSessions();
};

} //p2ps
