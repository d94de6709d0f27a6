#include "storage/internal/fileUtil.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace p2ps {

ssize_t bytesInFile(const std::filesystem::path& f_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(f_path, ec))
        return -1;

    auto size = std::filesystem::file_size(f_path, ec);
    if (ec)
        return -1;
    return static_cast<ssize_t>(size);
}

int createDirectories(const std::filesystem::path& d_path) {
    std::error_code ec;
    if (std::filesystem::is_directory(d_path, ec))
        return EXIT_SUCCESS;

    std::filesystem::create_directories(d_path, ec);
    if (ec || !std::filesystem::is_directory(d_path, ec))
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int writeTextFile(const std::filesystem::path& f_path, const std::string& content) {
    std::ofstream file(f_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return EXIT_FAILURE;

    file.write(content.data(), content.size());
    file.flush();
    if (!file.good())
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int replaceFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec)
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int deleteFile(const std::filesystem::path& f_path) {
    std::error_code ec;
    if (!std::filesystem::exists(f_path, ec))
        return EXIT_FAILURE;
    if (std::filesystem::remove(f_path, ec) && !ec)
        return EXIT_SUCCESS;
    return EXIT_FAILURE;
}

} //p2ps
