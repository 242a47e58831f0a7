/**
 * @file string_utils.h
 * @brief Common string utility functions
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace pkiforge {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase (ASCII only)
 */
std::string toUpper(const std::string& str);

/**
 * @brief Remove leading and trailing whitespace
 */
std::string trim(const std::string& str);

/**
 * @brief Join strings with a separator
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Convert bytes to lowercase hex string
 *
 * @param data Byte array
 * @param len Number of bytes
 * @return Hex string (2 chars per byte), empty for null/empty input
 */
std::string bytesToHex(const uint8_t* data, size_t len);

/**
 * @brief Compute lowercase hex SHA-256 of a string
 * @throws common::CryptoException if the digest cannot be computed
 */
std::string sha256Hex(const std::string& data);

} // namespace utils
} // namespace pkiforge
