/**
 * @file file_utils.cpp
 * @brief Plain file I/O helpers implementation
 */

#include "pkiforge/utils/file_utils.h"
#include "pkiforge/common/exceptions.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace pkiforge {
namespace utils {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw common::FilesystemException("Failed to open file: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw common::FilesystemException("Failed to read file: " + path);
    }
    return content;
}

void writeFile(const std::string& path, const std::string& content, unsigned int mode) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw common::FilesystemException("Failed to create file: " + path);
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        throw common::FilesystemException("Failed to write file: " + path);
    }

    std::error_code ec;
    std::filesystem::permissions(path, static_cast<std::filesystem::perms>(mode),
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw common::FilesystemException("Failed to set permissions on " + path + ": " + ec.message());
    }
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool directoryExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::string joinPath(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    return (std::filesystem::path(directory) / name).string();
}

} // namespace utils
} // namespace pkiforge
