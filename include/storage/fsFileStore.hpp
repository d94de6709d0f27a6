#pragma once

#include "storage/fileStore.hpp"

#include <filesystem>

namespace p2ps {

//prefix of in-progress downloads, never listed
inline constexpr char PARTIAL_PREFIX[] = ".p2ps-part-";

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * FsFileStore
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A FileStore over one directory on disk. Only regular files directly in
 *    the directory are listed, sorted by name so a static directory always
 *    lists the same way. Downloads are written to a hidden partial file in
 *    the same directory and renamed over the final name on commit, so a
 *    failed download never leaves a file that looks complete. The directory
 *    is created on first use.
 *
 * Member Variables:
 * -> dir:
 *    The directory backing this store.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class FsFileStore : public FileStore {
private:
    std::filesystem::path dir;

public:
    explicit FsFileStore(std::filesystem::path dir);

    std::vector<std::string>  listNames() override;
    ErrorCode                 openForRead(const std::string& f_name, ReadHandle& handle) override;
    std::unique_ptr<ByteSink> openForWrite(const std::string& f_name) override;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * createSampleFile
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Writes a small text file into the store, replacing any file with
     *    the same name. Used to seed an empty shared directory.
     *
     * Takes:
     * -> f_name:
     *    A plain file name.
     * -> content:
     *    The text to write.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int createSampleFile(const std::string& f_name, const std::string& content);

    const std::filesystem::path& directory() const { return dir; }
};

} //p2ps
