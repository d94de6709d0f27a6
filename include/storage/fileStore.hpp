#pragma once

#include "errors.hpp"
#include "networking/streams.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ReadHandle
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A file opened for sending.
 *
 * Fields:
 * -> size:
 *    Size of the file in bytes when it was opened.
 * -> source:
 *    The file contents. Closed when the handle is destroyed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct ReadHandle {
    uint64_t                    size = 0;
    std::unique_ptr<ByteSource> source;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * isPlainName
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Checks that a file name names a file directly inside a store: not empty,
 *    not "." or "..", and no '/', '\' or NUL. Names coming off the wire are
 *    checked with this before they touch a directory.
 *
 * Takes:
 * -> f_name:
 *    The name to check.
 *
 * Returns:
 * -> true if plain, false otherwise.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool isPlainName(const std::string& f_name);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * FileStore
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Where files physically live. The listener serves out of one, the client
 *    downloads into one. Implementations must be safe to call from several
 *    session threads at once.
 *
 * Functions:
 * -> listNames:
 *    The names available, in the store's enumeration order.
 * -> openForRead:
 *    Opens a file for sending. NOT_FOUND_ERROR if it isn't there,
 *    INVALID_NAME if the name isn't plain, IO_ERROR if it can't be read.
 * -> openForWrite:
 *    Opens a sink that becomes the file f_name on commit(). nullptr if the
 *    name isn't plain or storage can't be created.
 * -> digest:
 *    The SHA-256 of a stored file as lowercase hex, std::nullopt if the file
 *    can't be read.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual std::vector<std::string>  listNames()                                          = 0;
    virtual ErrorCode                 openForRead(const std::string& f_name, ReadHandle& handle) = 0;
    virtual std::unique_ptr<ByteSink> openForWrite(const std::string& f_name)              = 0;

    std::optional<std::string> digest(const std::string& f_name);
};

} //p2ps
