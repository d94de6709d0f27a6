#include "networking/messageFormatting.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace p2ps {

static const std::string NOT_FOUND_PREFIX = std::string(ERROR_PREFIX) + " File not found:";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool isCommand(const std::string& line, const std::string& command) {
    std::string received = trim(line);
    if (received.size() != command.size())
        return false;

    return std::equal(received.begin(), received.end(), command.begin(),
                      [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) ==
                                 std::toupper(static_cast<unsigned char>(b));
                      });
}

std::string createNoFileNameError() {
    return std::string(ERROR_PREFIX) + " No file name provided";
}

std::string createNotFoundError(const std::string& f_name) {
    return NOT_FOUND_PREFIX + " " + f_name;
}

std::string createUnknownCommandError(const std::string& command) {
    return std::string(ERROR_PREFIX) + " Unknown command: " + command;
}

bool isErrorResponse(const std::string& line) {
    return line.rfind(ERROR_PREFIX, 0) == 0;
}

bool isNotFoundError(const std::string& line) {
    return line.rfind(NOT_FOUND_PREFIX, 0) == 0;
}

std::optional<uint64_t> parseCount(const std::string& line) {
    std::string count_str = trim(line);
    if (count_str.empty())
        return std::nullopt;

    //strtoull would take a sign or leading space
    for (char c : count_str)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;

    errno = 0;
    char* end = nullptr;
    unsigned long long count = std::strtoull(count_str.c_str(), &end, 10);
    if (end == count_str.c_str() || *end != '\0' || errno == ERANGE)
        return std::nullopt;

    return static_cast<uint64_t>(count);
}

} //p2ps
