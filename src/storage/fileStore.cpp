#include "storage/fileStore.hpp"
#include "networking/framing.hpp"

#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace p2ps {

bool isPlainName(const std::string& f_name) {
    if (f_name.empty() || f_name == "." || f_name == "..")
        return false;
    return f_name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::optional<std::string> FileStore::digest(const std::string& f_name) {
    ReadHandle handle;
    if (openForRead(f_name, handle) != ErrorCode::OK)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx)
        return std::nullopt;

    if (1 != EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), NULL))
        return std::nullopt;

    std::vector<uint8_t> buff(CHUNK_SIZE);
    uint64_t total_read = 0;
    while (total_read < handle.size) {
        ssize_t res = handle.source->read(buff.data(), buff.size());
        if (res < 0)
            return std::nullopt;
        if (res == 0)
            break;
        if (1 != EVP_DigestUpdate(mdctx.get(), buff.data(), res))
            return std::nullopt;
        total_read += res;
    }

    uint8_t digest[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (1 != EVP_DigestFinal_ex(mdctx.get(), digest, &hash_len))
        return std::nullopt;

    std::ostringstream hex;
    for (unsigned int i = 0; i < hash_len; ++i)
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return hex.str();
}

} //p2ps
