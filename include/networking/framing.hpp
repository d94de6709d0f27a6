#pragma once

#include "errors.hpp"
#include "networking/streams.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * WIRE FORMAT:
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Two shapes share one TCP stream:
 * -> Lines:
 *    Text terminated by "\n". Commands, responses, and file list entries. A
 *    "\r" before the "\n" is dropped on receipt.
 * -> Length-prefixed frames:
 *    An 8-byte big-endian unsigned size, then exactly that many raw bytes. The
 *    size is authoritative, a receiver stops after size bytes.
 *
 * Both are read through the same buffer, a frame that arrives in the same
 * recv() as the line before it is never lost.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */

namespace p2ps {

inline constexpr size_t CHUNK_SIZE         = 4096;
inline constexpr size_t LENGTH_PREFIX_SIZE = 8;
inline constexpr size_t MAX_LINE_LENGTH    = 64 * 1024;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * FramedStream
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads and writes lines and length-prefixed frames over a ByteStream it
 *    borrows. Doesn't close the stream. One FramedStream per connection.
 *
 * Member Variables:
 * -> conn:
 *    The stream being framed.
 * -> pending:
 *    Bytes received but not yet handed out.
 * -> pending_at:
 *    Index of the first unconsumed byte in pending.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class FramedStream {
private:
    ByteStream&          conn;
    std::vector<uint8_t> pending;
    size_t               pending_at = 0;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * fillPending
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Replaces the (fully consumed) pending buffer with the next read off
     *    the stream.
     *
     * Returns:
     * -> Bytes read, 0 at end of stream, -1 on error.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ssize_t fillPending();

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * readBuffered
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Hands out buffered bytes first, reads straight off the stream once
     *    the buffer is empty.
     *
     * Returns:
     * -> Bytes read (at most len), 0 at end of stream, -1 on error.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ssize_t readBuffered(uint8_t* dst, size_t len);

public:
    explicit FramedStream(ByteStream& conn);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * writeLine
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Sends text followed by "\n". Nothing is buffered on our side.
     *
     * Takes:
     * -> text:
     *    The line, without terminator.
     *
     * Returns:
     * -> On success:
     *    true
     * -> On failure:
     *    false
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    bool writeLine(const std::string& text);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * readLine
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Blocks until a full line arrives. If the stream ends partway through
     *    a line, the partial line is returned. Lines over MAX_LINE_LENGTH are
     *    treated as a broken stream.
     *
     * Returns:
     * -> On success:
     *    The line without its terminator.
     * -> On failure:
     *    std::nullopt, the peer closed (or broke) the connection.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::optional<std::string> readLine();

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * writeLengthPrefixed
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Sends size as 8 big-endian bytes, then streams exactly size bytes
     *    from payload in CHUNK_SIZE pieces.
     *
     * Takes:
     * -> size:
     *    The number of payload bytes.
     * -> payload:
     *    Where the bytes come from. Must hold at least size bytes.
     *
     * Returns:
     * -> On success:
     *    ErrorCode::OK
     * -> On failure:
     *    ErrorCode::IO_ERROR, the stream or the source failed (including a
     *    source with fewer than size bytes).
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ErrorCode writeLengthPrefixed(uint64_t size, ByteSource& payload);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * readLengthPrefixed
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Reads the 8-byte size, then exactly that many bytes into sink in
     *    pieces of at most CHUNK_SIZE. Doesn't commit the sink.
     *
     * Takes:
     * -> sink:
     *    Where the bytes go.
     * -> size:
     *    Set to the declared size once the header is read.
     *
     * Returns:
     * -> On success:
     *    ErrorCode::OK
     * -> On failure:
     *    ErrorCode::PROTOCOL_ERROR if the stream ended inside the header.
     *    ErrorCode::SHORT_READ_ERROR if it ended before size bytes.
     *    ErrorCode::IO_ERROR if the stream or the sink failed.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    ErrorCode readLengthPrefixed(ByteSink& sink, uint64_t& size);
};

} //p2ps
