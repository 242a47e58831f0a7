/**
 * @file file_utils.h
 * @brief Plain file I/O helpers
 *
 * All failures are reported as pkiforge::common::FilesystemException.
 */

#pragma once

#include <string>

namespace pkiforge {
namespace utils {

/**
 * @brief Read a whole file into memory
 * @throws common::FilesystemException if the file cannot be opened or read
 */
std::string readFile(const std::string& path);

/**
 * @brief Create or truncate a file and write content to it
 * @param mode Permission bits applied after writing (e.g., 0600 for keys)
 * @throws common::FilesystemException on open/write failure
 */
void writeFile(const std::string& path, const std::string& content, unsigned int mode = 0644);

/**
 * @brief Check whether a regular file exists at path
 */
bool fileExists(const std::string& path);

/**
 * @brief Check whether a directory exists at path
 */
bool directoryExists(const std::string& path);

/**
 * @brief Join a directory and a file name
 */
std::string joinPath(const std::string& directory, const std::string& name);

} // namespace utils
} // namespace pkiforge
