#pragma once

#include "networking/internal/sockets/socketUtil.hpp"
#include "networking/streams.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace p2ps::test {

//a ByteStream that replays input and records everything written to it
class ScriptedStream : public ByteStream {
private:
    std::vector<uint8_t> input;
    size_t               read_at  = 0;
    size_t               max_read;
    std::string          output;
    bool                 open        = true;
    bool                 fail_writes = false;
    int                  close_calls = 0;

public:
    explicit ScriptedStream(const std::string& in,
                            size_t max_read=std::numeric_limits<size_t>::max())
        : input(in.begin(), in.end()), max_read(max_read) {}

    ScriptedStream(std::vector<uint8_t> in, size_t max_read)
        : input(std::move(in)), max_read(max_read) {}

    ssize_t readSome(uint8_t* buffer, size_t len) override {
        if (!open)
            return -1;
        size_t take = std::min({len, max_read, input.size() - read_at});
        if (take > 0)
            std::memcpy(buffer, input.data() + read_at, take);
        read_at += take;
        return take;
    }

    bool writeAll(const uint8_t* data, size_t len) override {
        if (!open || fail_writes)
            return false;
        output.append(reinterpret_cast<const char*>(data), len);
        return true;
    }

    void close() override {
        open = false;
        ++close_calls;
    }

    bool isOpen() const override { return open; }

    void failWrites() { fail_writes = true; }

    const std::string& written() const { return output; }
    int                closeCalls() const { return close_calls; }
};

class VectorSource : public ByteSource {
private:
    std::vector<uint8_t> data;
    size_t               offset = 0;

public:
    explicit VectorSource(std::vector<uint8_t> data) : data(std::move(data)) {}

    ssize_t read(uint8_t* buffer, size_t len) override {
        size_t take = std::min(len, data.size() - offset);
        if (take > 0)
            std::memcpy(buffer, data.data() + offset, take);
        offset += take;
        return take;
    }
};

class VectorSink : public ByteSink {
public:
    std::vector<uint8_t> data;
    bool                 committed  = false;
    bool                 discarded  = false;
    bool                 fail_write = false;

    bool write(const uint8_t* bytes, size_t len) override {
        if (fail_write)
            return false;
        data.insert(data.end(), bytes, bytes + len);
        return true;
    }

    int commit() override {
        committed = true;
        return EXIT_SUCCESS;
    }

    void discard() override {
        discarded = true;
        data.clear();
    }
};

//8-byte big-endian size as it goes on the wire
inline std::string sizeHeader(uint64_t size) {
    uint8_t header[8];
    msgLenToBytes(size, header);
    return std::string(reinterpret_cast<const char*>(header), 8);
}

//deterministic non-text payload
inline std::vector<uint8_t> patternBytes(size_t n) {
    std::vector<uint8_t> bytes(n);
    for (size_t i = 0; i < n; ++i)
        bytes[i] = static_cast<uint8_t>((i * 31 + 7) % 251);
    return bytes;
}

inline std::string asString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} //p2ps::test
