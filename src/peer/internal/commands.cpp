#include "peer/internal/commands.hpp"

#include <cctype>
#include <iostream>

namespace p2ps {

std::vector<std::string> splitArgs(const std::string& command) {
    std::vector<std::string> args;
    std::string curr_str;
    for (const char& c : command) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!curr_str.empty()) {
                args.push_back(curr_str);
                curr_str.clear();
            }
        } else {
            curr_str.push_back(c);
        }
    } if (!curr_str.empty()) args.push_back(curr_str);

    return args;
}

std::optional<uint16_t> parsePort(const std::string& port_str, uint16_t min_port) {
    if (port_str.empty() || port_str.size() > 5)
        return std::nullopt;

    uint32_t port = 0;
    for (char c : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        port = port * 10 + (c - '0');
    }

    if (port < min_port || port > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(port);
}

//ip + port commands, connect and test
static std::optional<MenuCommand> parsePeerArgs(const std::vector<std::string>& args,
                                                message_code                    code) {
    if (args.size() != 3) {
        std::cerr << "[err] Usage: " << args[0] << " <ip> <port>" << std::endl;
        return std::nullopt;
    }

    auto port = parsePort(args[2]);
    if (!port) {
        std::cerr << "[err] Invalid port: " << args[2] << std::endl;
        return std::nullopt;
    }

    MenuCommand cmd;
    cmd.code = code;
    cmd.ip   = args[1] == "localhost" ? "127.0.0.1" : args[1];
    cmd.port = port.value();
    return cmd;
}

std::optional<MenuCommand> parseCommand(const std::string& command) {
    std::vector<std::string> args = splitArgs(command);
    if (args.empty())
        return std::nullopt;

    const std::string& name = args[0];

    //no arg commands
    if (args.size() == 1) {
        if (name == "exit")       return MenuCommand{EXIT};
        if (name == "help")       return MenuCommand{HELP};
        if (name == "samples")    return MenuCommand{SAMPLES};
        if (name == "list")       return MenuCommand{LIST};
        if (name == "mine")       return MenuCommand{MINE};
        if (name == "disconnect") return MenuCommand{DISCONNECT};
        if (name == "status")     return MenuCommand{STATUS};
    }

    if (name == "connect") return parsePeerArgs(args, CONNECT);
    if (name == "test")    return parsePeerArgs(args, TEST_PEER);

    //download, everything after the command is the name
    if (name == "download") {
        size_t start = command.find("download") + 8;
        size_t first = command.find_first_not_of(" \t", start);
        size_t last  = command.find_last_not_of(" \t\r\n");
        if (first == std::string::npos || last < first) {
            std::cerr << "[err] Usage: download <file name>" << std::endl;
            return std::nullopt;
        }

        MenuCommand cmd;
        cmd.code   = DOWNLOAD;
        cmd.f_name = command.substr(first, last - first + 1);
        return cmd;
    }

    return std::nullopt;
}

} //p2ps
