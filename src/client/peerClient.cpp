#include "client/peerClient.hpp"
#include "client/internal/clientNetworking.hpp"
#include "networking/messageFormatting.hpp"
#include "sourceInfo.hpp"

#include <cstdlib>
#include <iostream>

namespace p2ps {

PeerClient::PeerClient(const std::string& ip,
                       uint16_t           port,
                       FileStore&         downloads,
                       long               connect_timeout_sec)
    : peer_ip(ip),
      peer_port(port),
      downloads(downloads),
      connect_timeout_sec(connect_timeout_sec) {}

PeerClient::~PeerClient() {
    closeHandle();
}

ErrorCode PeerClient::reportError(ErrorCode code, const std::string& msg) {
    last_error     = code;
    last_error_msg = msg;
    std::cerr << "[PeerClient] " << msg << " (" << errorName(code) << ")" << std::endl;
    return code;
}

int PeerClient::openHandle() {
    closeHandle();

    SourceInfo target;
    target.ip_addr = peer_ip;
    target.port    = peer_port;

    int sock = connectToSource(target, secondsToTimeval(connect_timeout_sec));
    if (sock < 0)
        return EXIT_FAILURE;

    conn      = std::make_unique<SocketStream>(sock);
    framed    = std::make_unique<FramedStream>(*conn);
    conn_used = false;
    return EXIT_SUCCESS;
}

void PeerClient::closeHandle() {
    //framed borrows conn
    framed.reset();
    conn.reset();
    conn_used = false;
}

void PeerClient::connectionLost() {
    closeHandle();
    if (connected)
        std::cerr << "[PeerClient] Lost connection to " << peer_ip << ":" << peer_port << std::endl;
    connected = false;
}

ErrorCode PeerClient::openSession() {
    if (!connected)
        return reportError(ErrorCode::NOT_CONNECTED, "Not connected to any peer");

    //the peer closes after answering, so a used connection is spent
    if (!conn || conn_used || !conn->isOpen()) {
        if (EXIT_SUCCESS != openHandle()) {
            connected = false;
            return reportError(ErrorCode::CONNECT_ERROR,
                               "Could not reconnect to " + peer_ip + ":" + std::to_string(peer_port));
        }
    }

    conn_used = true;
    return ErrorCode::OK;
}

bool PeerClient::connectToPeer() {
    connected = false;
    std::cout << "[PeerClient] Connecting to " << peer_ip << ":" << peer_port << "..." << std::endl;

    if (EXIT_SUCCESS != openHandle()) {
        reportError(ErrorCode::CONNECT_ERROR,
                    "Could not connect to " + peer_ip + ":" + std::to_string(peer_port));
        return false;
    }

    connected      = true;
    last_error     = ErrorCode::OK;
    last_error_msg.clear();
    std::cout << "[PeerClient] Connected to " << peer_ip << ":" << peer_port << std::endl;
    return true;
}

void PeerClient::disconnect() {
    if (!connected && !conn)
        return;

    closeHandle();
    connected = false;
    std::cout << "[PeerClient] Disconnected from " << peer_ip << ":" << peer_port << std::endl;
}

bool PeerClient::switchToPeer(const std::string& ip, uint16_t port) {
    disconnect();
    peer_ip   = ip;
    peer_port = port;
    return connectToPeer();
}

ErrorCode PeerClient::requestFileList(std::vector<std::string>& names) {
    ErrorCode session_res = openSession();
    if (session_res != ErrorCode::OK)
        return session_res;

    if (!framed->writeLine(LIST_FILES)) {
        connectionLost();
        return reportError(ErrorCode::IO_ERROR, "Could not send file list request");
    }

    auto count_line = framed->readLine();
    if (!count_line) {
        connectionLost();
        return reportError(ErrorCode::PROTOCOL_ERROR, "Peer closed before sending a file count");
    }

    if (isErrorResponse(count_line.value()))
        return reportError(ErrorCode::REMOTE_ERROR, "Peer replied: " + count_line.value());

    auto count = parseCount(count_line.value());
    if (!count)
        return reportError(ErrorCode::PROTOCOL_ERROR, "Invalid file count: " + count_line.value());

    std::vector<std::string> received;
    for (uint64_t i = 0; i < count.value(); ++i) {
        auto f_name = framed->readLine();
        if (!f_name) {
            connectionLost();
            return reportError(ErrorCode::PROTOCOL_ERROR,
                               "File list ended after " + std::to_string(i) + " of " +
                               std::to_string(count.value()) + " names");
        }
        received.push_back(f_name.value());
    }

    names          = std::move(received);
    last_error     = ErrorCode::OK;
    last_error_msg.clear();
    return ErrorCode::OK;
}

ErrorCode PeerClient::downloadFile(const std::string& f_name) {
    std::string name = trim(f_name);
    if (name.empty())
        return reportError(ErrorCode::INVALID_NAME, "No file name provided");
    if (!isPlainName(name))
        return reportError(ErrorCode::INVALID_NAME, "Invalid file name: " + name);

    ErrorCode session_res = openSession();
    if (session_res != ErrorCode::OK)
        return session_res;

    std::unique_ptr<ByteSink> sink = downloads.openForWrite(name);
    if (!sink)
        return reportError(ErrorCode::IO_ERROR, "Could not create local file for " + name);

    std::cout << "[PeerClient] Requesting " << name << " from " << peer_ip << ":"
              << peer_port << std::endl;

    if (!framed->writeLine(DOWNLOAD_FILE) || !framed->writeLine(name)) {
        sink->discard();
        connectionLost();
        return reportError(ErrorCode::IO_ERROR, "Could not send download request for " + name);
    }

    auto response = framed->readLine();
    if (!response) {
        sink->discard();
        connectionLost();
        return reportError(ErrorCode::PROTOCOL_ERROR, "Peer closed before answering for " + name);
    }

    if (trim(response.value()) != OK_RESPONSE) {
        sink->discard();
        if (isNotFoundError(response.value()))
            return reportError(ErrorCode::NOT_FOUND_ERROR, "File not found on peer: " + name);
        if (isErrorResponse(response.value()))
            return reportError(ErrorCode::REMOTE_ERROR, "Peer replied: " + response.value());
        return reportError(ErrorCode::PROTOCOL_ERROR, "Unexpected reply: " + response.value());
    }

    uint64_t  f_size   = 0;
    ErrorCode recv_res = framed->readLengthPrefixed(*sink, f_size);
    if (recv_res != ErrorCode::OK) {
        sink->discard();
        connectionLost();
        return reportError(recv_res, "Download of " + name + " failed");
    }

    if (EXIT_SUCCESS != sink->commit())
        return reportError(ErrorCode::IO_ERROR, "Could not save " + name);

    std::cout << "[PeerClient] Downloaded " << name << " (" << f_size << " bytes)" << std::endl;

    auto hash = downloads.digest(name);
    if (hash)
        std::cout << "[PeerClient] SHA-256: " << hash.value() << std::endl;

    last_error     = ErrorCode::OK;
    last_error_msg.clear();
    return ErrorCode::OK;
}

bool PeerClient::testPeerReachability(const std::string& ip,
                                      uint16_t           port,
                                      long               timeout_sec) {
    SourceInfo target;
    target.ip_addr = ip;
    target.port    = port;

    int sock = connectToSource(target, secondsToTimeval(timeout_sec));
    if (sock < 0)
        return false;

    SocketStream probe(sock);
    probe.close();
    return true;
}

std::string PeerClient::connectionInfo() const {
    std::string target = peer_ip + ":" + std::to_string(peer_port);
    if (connected)
        return "Connected to " + target;
    return "Not connected (target " + target + ")";
}

} //p2ps
