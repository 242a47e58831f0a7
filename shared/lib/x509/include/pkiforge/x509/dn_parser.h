/**
 * @file dn_parser.h
 * @brief Distinguished Name parsing
 *
 * Converts textual DNs as written in a manifest
 * ("cn=root", "CN=leaf,O=Example") to OpenSSL X509_NAME.
 */

#pragma once

#include <string>
#include <optional>
#include <openssl/x509.h>

namespace pkiforge {
namespace x509 {

/**
 * @brief Parse DN string to X509_NAME
 *
 * Supports both RFC2253 ("CN=Name,O=Org") and oneline ("/CN=Name/O=Org")
 * formats. Attribute names are case-insensitive ("cn" and "CN" are the same).
 * Attributes are added in the order written.
 *
 * @param dn DN string
 * @return X509_NAME (caller must free with X509_NAME_free), or nullptr on error
 */
X509_NAME* parseDnString(const std::string& dn);

/**
 * @brief Extract the Common Name from X509_NAME
 * @return CN value (last CN if several), or std::nullopt if absent
 */
std::optional<std::string> getCommonName(const X509_NAME* name);

} // namespace x509
} // namespace pkiforge
