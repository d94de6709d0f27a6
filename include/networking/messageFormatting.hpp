#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace p2ps {

/* 
 * Every session starts with one command line from the connecting peer.
 * Commands are matched case-insensitively.
 *
 * LIST_FILES is answered with a count line, then that many name lines.
 *
 * DOWNLOAD_FILE is followed by a name line, and answered with OK (then a
 * length-prefixed frame) or an ERROR: line.
 *
 * Anything else is answered with an ERROR: line. The server closes the
 * connection after answering.
 */

//COMMANDS
inline constexpr char LIST_FILES[]    = "LIST_FILES";
inline constexpr char DOWNLOAD_FILE[] = "DOWNLOAD_FILE";

//RESPONSES
inline constexpr char OK_RESPONSE[]   = "OK";
inline constexpr char ERROR_PREFIX[]  = "ERROR:";

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * trim
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Returns s without leading or trailing spaces, tabs, CR and LF.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string trim(const std::string& s);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * isCommand
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Checks if a received line is a given command, ignoring case and
 *    surrounding whitespace.
 *
 * Takes:
 * -> line:
 *    The line as received.
 * -> command:
 *    One of the command constants above.
 *
 * Returns:
 * -> true if they match, false otherwise.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool isCommand(const std::string& line, const std::string& command);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createNoFileNameError / createNotFoundError / createUnknownCommandError
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Build the ERROR: lines a session replies with.
 *
 * Returns:
 * -> "ERROR: No file name provided"
 * -> "ERROR: File not found: <f_name>"
 * -> "ERROR: Unknown command: <command>"
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string createNoFileNameError();
std::string createNotFoundError(const std::string& f_name);
std::string createUnknownCommandError(const std::string& command);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * isErrorResponse
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> True if the line is any ERROR: response.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool isErrorResponse(const std::string& line);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * isNotFoundError
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> True if the line is an "ERROR: File not found" response.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool isNotFoundError(const std::string& line);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseCount
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Parses the count line of a file list. Only decimal digits (with
 *    surrounding whitespace) are accepted, no sign, no trailing text.
 *
 * Takes:
 * -> line:
 *    The count line as received.
 *
 * Returns:
 * -> On success:
 *    The count.
 * -> On failure:
 *    std::nullopt, the line isn't a count.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<uint64_t> parseCount(const std::string& line);

} //p2ps
