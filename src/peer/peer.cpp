#include "peer/peer.hpp"
#include "peer/internal/commands.hpp"
#include "peer/internal/interrupts.hpp"
#include "client/peerClient.hpp"
#include "server/peerListener.hpp"
#include "storage/fsFileStore.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace p2ps {

static std::atomic<bool> stop_requested = false;

void signalHandler(int sig) {
    stop_requested = true;
}

void printHelp() {
    std::cout << "Available commands:\n";
    std::cout << "  samples             - Create sample files in the shared directory\n";
    std::cout << "  connect <ip> <port> - Connect to a peer\n";
    std::cout << "  list                - List the connected peer's files\n";
    std::cout << "  download <filename> - Download <filename> from the connected peer\n";
    std::cout << "  mine                - List my shared files\n";
    std::cout << "  test <ip> <port>    - Check whether a peer is reachable\n";
    std::cout << "  disconnect          - Disconnect from the current peer\n";
    std::cout << "  status              - Show the connection status\n";
    std::cout << "  help                - Show this message\n";
    std::cout << "  exit                - Quit\n";
}

void printNames(const std::vector<std::string>& names) {
    std::cout << std::string(40, '-') << "\n";
    for (size_t i = 0; i < names.size(); ++i)
        std::cout << (i + 1) << ". " << names[i] << "\n";
    std::cout << std::string(40, '-') << "\n";
    std::cout << "Total files: " << names.size() << std::endl;
}

void showMyFiles(FsFileStore& shared) {
    std::vector<std::string> names = shared.listNames();
    if (names.empty()) {
        std::cout << "No files in " << shared.directory().string() << "/" << std::endl;
        std::cout << "Add files there to share them with other peers." << std::endl;
        return;
    }

    printNames(names);
}

void createSampleFiles(FsFileStore& shared, uint16_t my_port) {
    std::time_t now = std::time(nullptr);
    std::string created = std::ctime(&now); //ends in \n

    std::random_device              rd;
    std::uniform_int_distribution<> dist(0, 999);

    int failed = 0;
    failed += shared.createSampleFile("hello.txt",
        "Hello from peer on port " + std::to_string(my_port) + "!\n"
        "This is a sample text file for testing p2pshare.\n"
        "Created: " + created);
    failed += shared.createSampleFile("info.txt",
        "=== PEER INFORMATION ===\n"
        "Peer Port: " + std::to_string(my_port) + "\n"
        "Created: " + created);
    failed += shared.createSampleFile("data.txt",
        "Sample data file with some numbers:\n"
        "1, 2, 3, 4, 5, 6, 7, 8, 9, 10\n"
        "Random number: " + std::to_string(dist(rd)) + "\n");

    if (failed)
        std::cerr << "[err] Could not create every sample file." << std::endl;
    else
        std::cout << "Sample files created in " << shared.directory().string() << "/" << std::endl;
    showMyFiles(shared);
}

//true if a client exists and is connected, complains otherwise
bool requireConnection(const std::unique_ptr<PeerClient>& client) {
    if (client && client->isConnected())
        return true;
    std::cerr << "[err] You must connect to a peer first!" << std::endl;
    return false;
}

void doConnect(std::unique_ptr<PeerClient>& client,
               FsFileStore&                 downloads,
               const Config&                config,
               const MenuCommand&           cmd) {
    if (cmd.port == config.port && cmd.ip == "127.0.0.1") {
        std::cerr << "[err] Cannot connect to yourself!" << std::endl;
        return;
    }

    if (client) {
        if (client->switchToPeer(cmd.ip, cmd.port)) {
            std::cout << "Connected! You can now list and download files." << std::endl;
            return;
        }
    } else {
        client = std::make_unique<PeerClient>(cmd.ip, cmd.port, downloads,
                                              config.connect_timeout_sec);
        if (client->connectToPeer()) {
            std::cout << "Connected! You can now list and download files." << std::endl;
            return;
        }
    }

    std::cerr << "Make sure the other peer is running and accessible." << std::endl;
}

void doList(std::unique_ptr<PeerClient>& client) {
    if (!requireConnection(client))
        return;

    std::vector<std::string> names;
    if (client->requestFileList(names) != ErrorCode::OK) {
        std::cerr << "[err] Failed to get file list from peer: "
                  << client->lastErrorMessage() << std::endl;
        return;
    }

    if (names.empty()) {
        std::cout << "Peer has no files available for sharing." << std::endl;
        return;
    }

    std::cout << "Files available on " << client->peerIP() << ":" << client->peerPort() << ":\n";
    printNames(names);
}

void doDownload(std::unique_ptr<PeerClient>& client,
                FsFileStore&                 downloads,
                const std::string&           f_name) {
    if (!requireConnection(client))
        return;

    if (client->downloadFile(f_name) != ErrorCode::OK) {
        std::cerr << "[err] Download failed: " << client->lastErrorMessage() << std::endl;
        return;
    }

    std::cout << "Download complete. Saved to " << downloads.directory().string() << "/" << std::endl;
}

void doTest(const Config& config, const MenuCommand& cmd) {
    std::cout << "Testing " << cmd.ip << ":" << cmd.port << "..." << std::endl;
    if (PeerClient::testPeerReachability(cmd.ip, cmd.port, config.probe_timeout_sec))
        std::cout << "Peer " << cmd.ip << ":" << cmd.port << " is reachable." << std::endl;
    else
        std::cout << "Peer " << cmd.ip << ":" << cmd.port << " is not reachable." << std::endl;
}

void doDisconnect(std::unique_ptr<PeerClient>& client) {
    if (!client || !client->isConnected()) {
        std::cout << "Not connected to any peer." << std::endl;
        return;
    }

    client->disconnect();
}

void peer_main(const Config&                config,
               FsFileStore&                 shared,
               FsFileStore&                 downloads,
               std::unique_ptr<PeerClient>& client) {
    //handle CONTROL+C here, where getline blocks
    if (catchInterrupts(signalHandler))
        std::cerr << "CONTROL+C won't stop the peer, type 'exit' instead." << std::endl;

    //welcome messages
    std::cout << "Welcome to p2pshare!"                                          << std::endl;
    std::cout << "Your peer is running on port: " << config.port                << std::endl;
    std::cout << "Files in " << config.shared_dir   << "/ are shared with peers." << std::endl;
    std::cout << "Downloads are saved to " << config.download_dir << "/"          << std::endl;
    std::cout << "Type 'help' for commands."                                     << std::endl;

    if (shared.listNames().empty()) {
        std::cout << "Shared directory is empty. Creating sample files..." << std::endl;
        createSampleFiles(shared, config.port);
    }

    //main loop
    while (!stop_requested) {
        std::string command;

        //get user input
        std::cout << "> ";
        if (!std::getline(std::cin, command)) break;

        auto cmd = parseCommand(command);
        if (!cmd) {
            if (!splitArgs(command).empty())
                std::cerr << "Unknown command. Type 'help' for usage." << std::endl;
            continue;
        }

        //execute command
        switch (cmd->code) {
            case EXIT: {
                stop_requested = true;
                break;
            }

            case HELP: {
                printHelp();
                break;
            }

            case SAMPLES: {
                createSampleFiles(shared, config.port);
                break;
            }

            case CONNECT: {
                doConnect(client, downloads, config, cmd.value());
                break;
            }

            case LIST: {
                doList(client);
                break;
            }

            case DOWNLOAD: {
                doDownload(client, downloads, cmd->f_name);
                break;
            }

            case MINE: {
                showMyFiles(shared);
                break;
            }

            case TEST_PEER: {
                doTest(config, cmd.value());
                break;
            }

            case DISCONNECT: {
                doDisconnect(client);
                break;
            }

            case STATUS: {
                if (client)
                    std::cout << client->connectionInfo() << std::endl;
                else
                    std::cout << "Not connected to any peer." << std::endl;
                break;
            }
        }
    }

    //if a signal killed the main loop
    if (!stop_requested) stop_requested = true;
}

int run_peer(const Config& config) {
    //workers inherit this, SIGINT only reaches the menu thread
    if (blockInterrupts())
        return EXIT_FAILURE;

    FsFileStore shared(config.shared_dir);
    FsFileStore downloads(config.download_dir);

    PeerListener listener(shared);
    ErrorCode    start_res = listener.start(config.port);
    if (start_res != ErrorCode::OK) {
        std::cerr << "Could not start the peer listener (" << errorName(start_res)
                  << "). Exiting..." << std::endl;
        return EXIT_FAILURE;
    }

    std::unique_ptr<PeerClient> client;
    peer_main(config, shared, downloads, client);

    //shutdown
    std::cout << "\nShutting down..." << std::endl;
    if (client)
        client->disconnect();
    listener.stop(); //running sessions are cut off when listener goes out of scope

    std::cout << "Goodbye!" << std::endl;
    return EXIT_SUCCESS;
}

} //p2ps
