#pragma once

#include "storage/fileStore.hpp"

#include <map>
#include <mutex>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * MemoryFileStore
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A FileStore kept entirely in memory, for running sessions and clients
 *    without a disk. Lists names sorted. An open source reads a snapshot, so
 *    removing or replacing a file doesn't disturb a transfer in progress.
 *    Sinks commit into this store and must not outlive it.
 *
 * Member Variables:
 * -> files:
 *    Name to contents.
 * -> files_mtx:
 *    Guards files, sessions call in from their own threads.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class MemoryFileStore : public FileStore {
private:
    std::map<std::string, std::shared_ptr<const std::vector<uint8_t>>> files;
    std::mutex                                                         files_mtx;

public:
    std::vector<std::string>  listNames() override;
    ErrorCode                 openForRead(const std::string& f_name, ReadHandle& handle) override;
    std::unique_ptr<ByteSink> openForWrite(const std::string& f_name) override;

    //adds or replaces a file
    void put(const std::string& f_name, std::vector<uint8_t> data);
    void put(const std::string& f_name, const std::string& text);

    //true if a file was removed
    bool remove(const std::string& f_name);

    //a copy of a file's contents, std::nullopt if it doesn't exist
    std::optional<std::vector<uint8_t>> contents(const std::string& f_name);
};

} //p2ps
