#include "server/peerListener.hpp"
#include "server/internal/sessionHandler.hpp"
#include "networking/socket.hpp"
#include "networking/socketStream.hpp"
#include "sourceInfo.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace p2ps {

PeerListener::PeerListener(FileStore& store)
    : store(store) {}

PeerListener::~PeerListener() {
    stop();
    abortSessions();
    waitForSessions();
}

ErrorCode PeerListener::start(uint16_t port) {
    std::lock_guard<std::mutex> lock(lifecycle_mtx);
    if (listening.load()) {
        std::cerr << "[PeerListener] Already listening on port " << listen_port.load() << std::endl;
        return ErrorCode::IO_ERROR;
    }

    //left behind if the accept loop gave up on its own
    releaseSocket();

    ErrorCode open_err  = ErrorCode::OK;
    auto      sock_port = openSocket(true, port, open_err);
    if (!sock_port) {
        if (open_err == ErrorCode::BIND_ERROR) {
            std::cerr << "[PeerListener] Port " << port << " is already in use." << std::endl;
            std::cerr << "[PeerListener] Tip: try another port between 1024 and 65535." << std::endl;
        } else {
            std::cerr << "[PeerListener] Could not create listening socket." << std::endl;
        }
        return open_err;
    }

    //listen closes the socket on failure
    if (tcp::listen(sock_port->first, LISTEN_BACKLOG)) {
        std::cerr << "[PeerListener] Could not start listening." << std::endl;
        return ErrorCode::IO_ERROR;
    }

    listen_fd = sock_port->first;
    listen_port.store(sock_port->second);
    stopping.store(false);
    listening.store(true);

    try {
        accept_thread = std::thread(&PeerListener::acceptLoop, this);
    } catch (const std::system_error& e) {
        std::cerr << "[PeerListener] Could not start accept thread: " << e.what() << std::endl;
        listening.store(false);
        closeSocket(listen_fd);
        listen_fd = -1;
        return ErrorCode::IO_ERROR;
    }

    std::cout << "[PeerListener] Listening on port " << listen_port.load() << std::endl;
    return ErrorCode::OK;
}

void PeerListener::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mtx);
    if (listen_fd < 0)
        return;

    stopping.store(true);

    //wakes the blocked accept()
    shutdown(listen_fd, SHUT_RDWR);
    releaseSocket();
    listening.store(false);
    std::cout << "[PeerListener] Stopped listening on port " << listen_port.load() << std::endl;
}

void PeerListener::releaseSocket() {
    if (accept_thread.joinable())
        accept_thread.join();

    if (listen_fd >= 0) {
        closeSocket(listen_fd);
        listen_fd = -1;
    }
}

size_t PeerListener::activeSessions() {
    std::lock_guard<std::mutex> lock(sessions_mtx);
    return session_count;
}

void PeerListener::waitForSessions() {
    std::unique_lock<std::mutex> lock(sessions_mtx);
    sessions_cv.wait(lock, [this] { return session_count == 0; });
}

void PeerListener::acceptLoop() {
    while (!stopping.load()) {
        SourceInfo peer;
        int peer_sock = tcp::accept(listen_fd, peer);
        if (peer_sock < 0) {
            if (stopping.load())
                break;

            int accept_errno = errno;
            if (accept_errno == EINTR)
                continue;
            std::cerr << "[PeerListener] Error accepting connection: "
                      << std::strerror(accept_errno) << std::endl;

            //socket is unusable
            if (accept_errno == EBADF || accept_errno == EINVAL || accept_errno == ENOTSOCK)
                break;
            continue;
        }

        std::cout << "[PeerListener] New connection from " << peer.label() << std::endl;

        //shutdown() on the dup reaches the session's socket
        int watch_fd = dup(peer_sock);
        {
            std::lock_guard<std::mutex> lock(sessions_mtx);
            ++session_count;
            if (watch_fd >= 0)
                session_watch_fds.insert(watch_fd);
        }

        try {
            std::thread(&PeerListener::runSession, this, peer_sock, watch_fd, peer).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[PeerListener] Could not start session thread: " << e.what() << std::endl;
            closeSocket(peer_sock);
            endSession(watch_fd);
        }
    }

    listening.store(false);
}

void PeerListener::runSession(int peer_sock, int watch_fd, SourceInfo peer) {
    try {
        SocketStream conn(peer_sock);
        ErrorCode res = handleSession(conn, store, peer.label());
        if (res != ErrorCode::OK)
            std::cerr << "[PeerListener] Session with " << peer.label() << " ended with "
                      << errorName(res) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[PeerListener] Session with " << peer.label() << " failed: "
                  << e.what() << std::endl;
    }

    endSession(watch_fd);
}

void PeerListener::endSession(int watch_fd) {
    std::lock_guard<std::mutex> lock(sessions_mtx);
    if (watch_fd >= 0) {
        session_watch_fds.erase(watch_fd);
        closeSocket(watch_fd);
    }
    --session_count;
    sessions_cv.notify_all();
}

void PeerListener::abortSessions() {
    std::lock_guard<std::mutex> lock(sessions_mtx);
    for (int watch_fd : session_watch_fds)
        shutdown(watch_fd, SHUT_RDWR);
}

} //p2ps
