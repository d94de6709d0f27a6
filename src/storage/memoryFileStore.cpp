#include "storage/memoryFileStore.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace p2ps {

namespace {

class MemorySource : public ByteSource {
private:
    std::shared_ptr<const std::vector<uint8_t>> data;
    size_t                                      offset = 0;

public:
    explicit MemorySource(std::shared_ptr<const std::vector<uint8_t>> data)
        : data(std::move(data)) {}

    ssize_t read(uint8_t* buffer, size_t len) override {
        size_t take = std::min(len, data->size() - offset);
        if (take > 0)
            std::memcpy(buffer, data->data() + offset, take);
        offset += take;
        return take;
    }
};

class MemorySink : public ByteSink {
private:
    MemoryFileStore&     store;
    std::string          f_name;
    std::vector<uint8_t> data;
    bool                 finished = false;

public:
    MemorySink(MemoryFileStore& store, std::string f_name)
        : store(store), f_name(std::move(f_name)) {}

    bool write(const uint8_t* bytes, size_t len) override {
        if (finished)
            return false;
        data.insert(data.end(), bytes, bytes + len);
        return true;
    }

    int commit() override {
        if (finished)
            return EXIT_FAILURE;
        finished = true;
        store.put(f_name, std::move(data));
        return EXIT_SUCCESS;
    }

    void discard() override {
        finished = true;
        data.clear();
    }
};

} //namespace

std::vector<std::string> MemoryFileStore::listNames() {
    std::lock_guard<std::mutex> lock(files_mtx);
    std::vector<std::string> names;
    names.reserve(files.size());
    for (const auto& [f_name, data] : files)
        names.push_back(f_name);
    return names;
}

ErrorCode MemoryFileStore::openForRead(const std::string& f_name, ReadHandle& handle) {
    if (!isPlainName(f_name))
        return ErrorCode::INVALID_NAME;

    std::lock_guard<std::mutex> lock(files_mtx);
    auto it = files.find(f_name);
    if (it == files.end())
        return ErrorCode::NOT_FOUND_ERROR;

    handle.size   = it->second->size();
    handle.source = std::make_unique<MemorySource>(it->second);
    return ErrorCode::OK;
}

std::unique_ptr<ByteSink> MemoryFileStore::openForWrite(const std::string& f_name) {
    if (!isPlainName(f_name))
        return nullptr;
    return std::make_unique<MemorySink>(*this, f_name);
}

void MemoryFileStore::put(const std::string& f_name, std::vector<uint8_t> data) {
    auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(data));
    std::lock_guard<std::mutex> lock(files_mtx);
    files[f_name] = std::move(shared);
}

void MemoryFileStore::put(const std::string& f_name, const std::string& text) {
    put(f_name, std::vector<uint8_t>(text.begin(), text.end()));
}

bool MemoryFileStore::remove(const std::string& f_name) {
    std::lock_guard<std::mutex> lock(files_mtx);
    return files.erase(f_name) > 0;
}

std::optional<std::vector<uint8_t>> MemoryFileStore::contents(const std::string& f_name) {
    std::lock_guard<std::mutex> lock(files_mtx);
    auto it = files.find(f_name);
    if (it == files.end())
        return std::nullopt;
    return *it->second;
}

} //p2ps
