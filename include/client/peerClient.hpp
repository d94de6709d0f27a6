#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "networking/framing.hpp"
#include "networking/socketStream.hpp"
#include "storage/fileStore.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeerClient
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The outbound side of a peer. Talks to one remote peer at a time and holds
 *    at most one socket. Downloads are written into the store handed to the
 *    constructor, which must outlive the client.
 *
 *    A remote peer serves one command per connection. Once a command has been
 *    answered, the next one transparently opens a fresh connection to the same
 *    peer. After disconnect() or a broken connection, commands fail with
 *    ErrorCode::NOT_CONNECTED until connectToPeer() or switchToPeer() works.
 *
 *    Not thread safe, one caller at a time.
 *
 * Member Variables:
 * -> peer_ip, peer_port:
 *    The target peer.
 * -> downloads:
 *    Where downloaded files go.
 * -> connect_timeout_sec:
 *    How long connects are attempted for.
 * -> conn:
 *    The open connection, nullptr when there is none.
 * -> framed:
 *    Framing over conn, lives and dies with it.
 * -> connected:
 *    Set by a successful connect, cleared by disconnect() or a broken
 *    connection.
 * -> conn_used:
 *    Set once a command has been sent over conn.
 * -> last_error, last_error_msg:
 *    The outcome of the last failed operation.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class PeerClient {
private:
    std::string                   peer_ip;
    uint16_t                      peer_port;
    FileStore&                    downloads;
    long                          connect_timeout_sec;

    std::unique_ptr<SocketStream> conn;
    std::unique_ptr<FramedStream> framed;
    bool                          connected = false;
    bool                          conn_used = false;

    ErrorCode                     last_error = ErrorCode::OK;
    std::string                   last_error_msg;

    //records a failure, logs it, and hands the code back
    ErrorCode reportError(ErrorCode code, const std::string& msg);

    //opens a fresh connection if the current one was already used
    ErrorCode openSession();

    //opens the socket, without touching connected
    int  openHandle();
    void closeHandle();

    //the connection broke, drop it and mark disconnected
    void connectionLost();

public:
    PeerClient(const std::string& ip,
               uint16_t           port,
               FileStore&         downloads,
               long               connect_timeout_sec=CONNECT_TIMEOUT_SEC);
    ~PeerClient();

    PeerClient(const PeerClient&)            = delete;
    PeerClient& operator=(const PeerClient&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * connectToPeer
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Connects to the target peer, giving up after connect_timeout_sec. Any
     *    existing connection is closed first.
     *
     * Returns:
     * -> On success:
     *    true
     * -> On failure:
     *    false, lastError() is ErrorCode::CONNECT_ERROR.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    bool connectToPeer();

    bool isConnected() const { return connected; }

    //closes the connection, calling it again does nothing
    void disconnect();

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * switchToPeer
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Disconnects, retargets to ip:port, and connects to the new peer.
     *
     * Returns:
     * -> Same as connectToPeer(). The new target is kept even on failure.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    bool switchToPeer(const std::string& ip, uint16_t port);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * requestFileList
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Asks the peer for the files it shares.
     *
     * Takes:
     * -> names:
     *    Replaced with the names in the order the peer sent them. Untouched on
     *    failure, so an empty list is distinguishable from an error.
     *
     * Returns:
     * -> On success:
     *    ErrorCode::OK
     * -> On failure:
     *    ErrorCode::NOT_CONNECTED, CONNECT_ERROR, IO_ERROR, REMOTE_ERROR, or
     *    PROTOCOL_ERROR for a bad count or a list cut short.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ErrorCode requestFileList(std::vector<std::string>& names);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * downloadFile
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Downloads f_name from the peer into the download store. The file only
     *    appears in the store once every byte has arrived, a failed transfer
     *    leaves nothing behind.
     *
     * Takes:
     * -> f_name:
     *    The name as the peer listed it. Surrounding whitespace is ignored.
     *
     * Returns:
     * -> On success:
     *    ErrorCode::OK
     * -> On failure:
     *    ErrorCode::INVALID_NAME for a blank or non-plain name.
     *    ErrorCode::NOT_FOUND_ERROR if the peer doesn't have it.
     *    ErrorCode::REMOTE_ERROR for any other ERROR: reply.
     *    ErrorCode::PROTOCOL_ERROR for an unexpected reply.
     *    ErrorCode::SHORT_READ_ERROR if the transfer was cut short.
     *    ErrorCode::NOT_CONNECTED, CONNECT_ERROR, or IO_ERROR otherwise.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ErrorCode downloadFile(const std::string& f_name);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * testPeerReachability
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Checks whether something accepts connections at ip:port. The probe
     *    connection is closed straight away and nothing is sent.
     *
     * Takes:
     * -> ip, port:
     *    Where to probe.
     * -> timeout_sec:
     *    How long to wait for the connection.
     *
     * Returns:
     * -> true if reachable, false otherwise.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    static bool testPeerReachability(const std::string& ip,
                                     uint16_t           port,
                                     long               timeout_sec=PROBE_TIMEOUT_SEC);

    const std::string& peerIP() const { return peer_ip; }
    uint16_t           peerPort() const { return peer_port; }
    std::string        connectionInfo() const;
    ErrorCode          lastError() const { return last_error; }
    const std::string& lastErrorMessage() const { return last_error_msg; }
};

} //p2ps
