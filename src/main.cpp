#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config.hpp"
#include "peer/peer.hpp"
#include "peer/internal/commands.hpp"

static void printUsage() {
    std::cerr << "USAGE: p2pshare <port>"                                                << std::endl;
    std::cerr << "       p2pshare --port <#> [--shared <dir>] [--download <dir>]"        << std::endl;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseArgs
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Fills config from the command line. Exits with a usage message on a bad
 *    or missing argument.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
static void parseArgs(int argc, char** argv, p2ps::Config& config) {
    std::string port_str;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--port" || arg == "--shared" || arg == "--download") {
            if (i+1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                printUsage();
                exit(EXIT_FAILURE);
            }

            std::string value = argv[++i];
            if (arg == "--port")     port_str            = value;
            if (arg == "--shared")   config.shared_dir   = value;
            if (arg == "--download") config.download_dir = value;
            continue;
        }

        //bare port
        if (port_str.empty() && arg.rfind("--", 0) != 0) {
            port_str = arg;
            continue;
        }

        std::cerr << "Unknown argument: " << arg << std::endl;
        printUsage();
        exit(EXIT_FAILURE);
    }

    if (port_str.empty()) {
        std::cerr << "Missing port!" << std::endl;
        printUsage();
        exit(EXIT_FAILURE);
    }

    auto port = p2ps::parsePort(port_str, 1024);
    if (!port) {
        std::cerr << "Port must be between 1024 & 65535 inclusive." << std::endl;
        exit(EXIT_FAILURE);
    }
    config.port = port.value();

    if (config.shared_dir.empty() || config.download_dir.empty()) {
        std::cerr << "Directories can't be empty." << std::endl;
        exit(EXIT_FAILURE);
    }
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * main
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Peer to peer file sharing. Shares one directory with other peers and
 *    downloads from them into another.
 *
 * Takes:
 * -> argc:
 *    Number of command line args supplied.
 *
 * -> argv:
 *    The array of args.
 *
 * Returns:
 * -> On success:
 *    0
 * -> On failure:
 *    1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int main(int argc, char** argv) {
    p2ps::Config config;
    parseArgs(argc, argv, config);
    return p2ps::run_peer(config);
}
