#pragma once

#include <filesystem>
#include <string>
#include <sys/types.h>

// THESE FUNCTIONS MAKE ZERO EFFORT TO HANDLE CONCURRENCY. CALLERS WRITING THE
// SAME PATH FROM SEVERAL THREADS MUST USE DISTINCT TEMPORARY PATHS.

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * bytesInFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Returns the size of a regular file, in bytes.
 *
 * Takes:
 * -> f_path:
 *    The path to the file.
 *
 * Returns:
 * -> On success:
 *    The size.
 * -> On failure:
 *    -1, including when f_path isn't a regular file.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t bytesInFile(const std::filesystem::path& f_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createDirectories
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Makes sure a directory exists, creating it and its parents if needed.
 *
 * Takes:
 * -> d_path:
 *    The directory.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int createDirectories(const std::filesystem::path& d_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * writeTextFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates (or truncates) a file and writes content to it.
 *
 * Takes:
 * -> f_path:
 *    The file to write.
 * -> content:
 *    The bytes to write.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int writeTextFile(const std::filesystem::path& f_path, const std::string& content);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * replaceFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Moves from onto to, replacing to if it exists. Both must be on the same
 *    filesystem so the move is a rename.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int replaceFile(const std::filesystem::path& from, const std::filesystem::path& to);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * deleteFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Deletes the file at f_path. If no file exists to delete, returns with an
 *    error.
 *
 * Takes:
 * -> f_path:
 *    The file to delete.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int deleteFile(const std::filesystem::path& f_path);

} //p2ps
