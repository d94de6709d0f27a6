#include "storage/fsFileStore.hpp"
#include "storage/internal/fileUtil.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace p2ps {

namespace {

class FileSource : public ByteSource {
private:
    std::ifstream file;

public:
    explicit FileSource(const std::filesystem::path& f_path)
        : file(f_path, std::ios::binary) {}

    bool isOpen() const { return file.is_open(); }

    ssize_t read(uint8_t* buffer, size_t len) override {
        if (!file.is_open())
            return -1;
        file.read(reinterpret_cast<char*>(buffer), len);
        if (file.bad())
            return -1;
        return file.gcount();
    }
};

class FileSink : public ByteSink {
private:
    std::filesystem::path final_path;
    std::filesystem::path partial_path;
    std::ofstream         file;
    bool                  finished = false;

public:
    FileSink(std::filesystem::path final_path, std::filesystem::path partial_path)
        : final_path(std::move(final_path)),
          partial_path(std::move(partial_path)),
          file(this->partial_path, std::ios::binary | std::ios::trunc) {}

    ~FileSink() override {
        discard();
    }

    bool isOpen() const { return file.is_open(); }

    bool write(const uint8_t* data, size_t len) override {
        if (finished)
            return false;
        file.write(reinterpret_cast<const char*>(data), len);
        return file.good();
    }

    int commit() override {
        if (finished)
            return EXIT_FAILURE;

        file.flush();
        bool written = file.good();
        file.close();
        if (!written || EXIT_SUCCESS != replaceFile(partial_path, final_path)) {
            discard();
            return EXIT_FAILURE;
        }

        finished = true;
        return EXIT_SUCCESS;
    }

    void discard() override {
        if (finished)
            return;
        finished = true;
        if (file.is_open())
            file.close();
        deleteFile(partial_path);
    }
};

std::atomic<uint64_t> next_partial_id{0};

} //namespace

FsFileStore::FsFileStore(std::filesystem::path dir) : dir(std::move(dir)) {}

std::vector<std::string> FsFileStore::listNames() {
    std::vector<std::string> names;
    if (EXIT_SUCCESS != createDirectories(dir)) {
        std::cerr << "[FsFileStore] Could not create directory " << dir << std::endl;
        return names;
    }

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir, ec);
         !ec && it != std::filesystem::directory_iterator();
         it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;

        std::string f_name = it->path().filename().string();
        if (f_name.rfind(PARTIAL_PREFIX, 0) == 0)
            continue;
        names.push_back(f_name);
    }

    if (ec)
        std::cerr << "[FsFileStore] Error listing " << dir << ": " << ec.message() << std::endl;

    std::sort(names.begin(), names.end());
    return names;
}

ErrorCode FsFileStore::openForRead(const std::string& f_name, ReadHandle& handle) {
    if (!isPlainName(f_name))
        return ErrorCode::INVALID_NAME;

    std::filesystem::path f_path = dir / f_name;
    ssize_t f_size = bytesInFile(f_path);
    if (f_size < 0)
        return ErrorCode::NOT_FOUND_ERROR;

    auto source = std::make_unique<FileSource>(f_path);
    if (!source->isOpen())
        return ErrorCode::NOT_FOUND_ERROR; //deleted between size and open

    handle.size   = static_cast<uint64_t>(f_size);
    handle.source = std::move(source);
    return ErrorCode::OK;
}

std::unique_ptr<ByteSink> FsFileStore::openForWrite(const std::string& f_name) {
    if (!isPlainName(f_name))
        return nullptr;

    if (EXIT_SUCCESS != createDirectories(dir)) {
        std::cerr << "[FsFileStore] Could not create directory " << dir << std::endl;
        return nullptr;
    }

    std::string partial_name = std::string(PARTIAL_PREFIX)
                             + std::to_string(next_partial_id.fetch_add(1))
                             + "-" + f_name;
    auto sink = std::make_unique<FileSink>(dir / f_name, dir / partial_name);
    if (!sink->isOpen())
        return nullptr;
    return sink;
}

int FsFileStore::createSampleFile(const std::string& f_name, const std::string& content) {
    if (!isPlainName(f_name))
        return EXIT_FAILURE;

    if (EXIT_SUCCESS != createDirectories(dir))
        return EXIT_FAILURE;

    if (EXIT_SUCCESS != writeTextFile(dir / f_name, content)) {
        std::cerr << "[FsFileStore] Error creating sample file: " << f_name << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "[FsFileStore] Sample file created: " << f_name << std::endl;
    return EXIT_SUCCESS;
}

} //p2ps
