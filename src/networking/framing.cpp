#include "networking/framing.hpp"
#include "networking/internal/sockets/socketUtil.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace p2ps {

FramedStream::FramedStream(ByteStream& conn) : conn(conn) {}

ssize_t FramedStream::fillPending() {
    pending.resize(CHUNK_SIZE);
    pending_at = 0;

    ssize_t bytes_read = conn.readSome(pending.data(), pending.size());
    if (bytes_read <= 0) {
        pending.clear();
        return bytes_read;
    }

    pending.resize(bytes_read);
    return bytes_read;
}

ssize_t FramedStream::readBuffered(uint8_t* dst, size_t len) {
    if (len == 0)
        return 0;

    size_t buffered = pending.size() - pending_at;
    if (buffered == 0)
        return conn.readSome(dst, len);

    size_t take = std::min(buffered, len);
    std::memcpy(dst, pending.data() + pending_at, take);
    pending_at += take;
    return take;
}

bool FramedStream::writeLine(const std::string& text) {
    std::string line = text + "\n";
    return conn.writeAll(reinterpret_cast<const uint8_t*>(line.data()), line.size());
}

std::optional<std::string> FramedStream::readLine() {
    std::string line;
    while (true) {
        if (pending_at == pending.size()) {
            ssize_t bytes_read = fillPending();
            if (bytes_read < 0)
                return std::nullopt;
            if (bytes_read == 0) {
                //closed mid-line, hand back what arrived
                if (line.empty())
                    return std::nullopt;
                break;
            }
        }

        auto begin   = pending.begin() + pending_at;
        auto newline = std::find(begin, pending.end(), '\n');
        line.append(begin, newline);

        if (newline != pending.end()) {
            pending_at = (newline - pending.begin()) + 1;
            break;
        }

        pending_at = pending.size();
        if (line.size() > MAX_LINE_LENGTH) {
            std::cerr << "[readLine] Line exceeds " << MAX_LINE_LENGTH << " bytes, dropping stream." << std::endl;
            return std::nullopt;
        }
    }

    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

ErrorCode FramedStream::writeLengthPrefixed(uint64_t size, ByteSource& payload) {
    uint8_t header[LENGTH_PREFIX_SIZE];
    msgLenToBytes(size, header);
    if (!conn.writeAll(header, LENGTH_PREFIX_SIZE))
        return ErrorCode::IO_ERROR;

    std::vector<uint8_t> chunk(CHUNK_SIZE);
    uint64_t total_sent = 0;
    while (total_sent < size) {
        size_t  want       = static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, size - total_sent));
        ssize_t bytes_read = payload.read(chunk.data(), want);
        if (bytes_read <= 0)
            return ErrorCode::IO_ERROR; //source dried up before size

        if (!conn.writeAll(chunk.data(), bytes_read))
            return ErrorCode::IO_ERROR;
        total_sent += bytes_read;
    }

    return ErrorCode::OK;
}

ErrorCode FramedStream::readLengthPrefixed(ByteSink& sink, uint64_t& size) {
    uint8_t header[LENGTH_PREFIX_SIZE];
    size_t  header_read = 0;
    while (header_read < LENGTH_PREFIX_SIZE) {
        ssize_t bytes_read = readBuffered(header + header_read, LENGTH_PREFIX_SIZE - header_read);
        if (bytes_read == 0)
            return ErrorCode::PROTOCOL_ERROR;
        if (bytes_read < 0)
            return ErrorCode::IO_ERROR;
        header_read += bytes_read;
    }

    size = bytesToMsgLen(header);

    std::vector<uint8_t> chunk(CHUNK_SIZE);
    uint64_t total_recv = 0;
    while (total_recv < size) {
        size_t  want       = static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, size - total_recv));
        ssize_t bytes_read = readBuffered(chunk.data(), want);
        if (bytes_read == 0) {
            std::cerr << "[readLengthPrefixed] Stream ended after " << total_recv
                      << " of " << size << " bytes." << std::endl;
            return ErrorCode::SHORT_READ_ERROR;
        }
        if (bytes_read < 0)
            return ErrorCode::IO_ERROR;

        if (!sink.write(chunk.data(), bytes_read))
            return ErrorCode::IO_ERROR;
        total_recv += bytes_read;
    }

    return ErrorCode::OK;
}

} //p2ps
