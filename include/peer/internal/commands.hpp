#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace p2ps {

enum message_code {
    EXIT,
    HELP,
    SAMPLES,
    CONNECT,
    LIST,
    DOWNLOAD,
    MINE,
    TEST_PEER,
    DISCONNECT,
    STATUS,
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * MenuCommand
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A parsed line of user input.
 *
 * Fields:
 * -> code:
 *    Which command.
 * -> ip, port:
 *    The peer for CONNECT and TEST_PEER. localhost is already mapped to 127.0.0.1.
 * -> f_name:
 *    The file for DOWNLOAD.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct MenuCommand {
    message_code code;
    std::string  ip;
    uint16_t     port = 0;
    std::string  f_name;
};

//splits on spaces, runs of spaces count as one
std::vector<std::string> splitArgs(const std::string& command);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parsePort
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Parses a port number. Digits only.
 *
 * Takes:
 * -> port_str:
 *    The text to parse.
 * -> min_port:
 *    The smallest port accepted.
 *
 * Returns:
 * -> On success:
 *    The port, between min_port and 65535.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<uint16_t> parsePort(const std::string& port_str, uint16_t min_port=1);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseCommand
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Parses a line typed at the menu prompt. Usage errors for known commands
 *    are printed here.
 *
 * Takes:
 * -> command:
 *    The line as typed.
 *
 * Returns:
 * -> On success:
 *    The command and its arguments.
 * -> On failure:
 *    std::nullopt, unknown command or bad arguments.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<MenuCommand> parseCommand(const std::string& command);

} //p2ps
