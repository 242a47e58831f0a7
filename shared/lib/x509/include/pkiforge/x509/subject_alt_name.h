/**
 * @file subject_alt_name.h
 * @brief Typed Subject Alternative Name entries
 *
 * Manifest entries are written with a type prefix ("DNS:", "IP:", "URI:").
 * parseSubjectAltName() turns them into a tagged variant so that
 * certificate building never inspects string prefixes.
 */

#pragma once

#include <string>
#include <variant>
#include <vector>
#include <cstdint>
#include <openssl/x509v3.h>

namespace pkiforge {
namespace x509 {

/// @brief dNSName entry
struct DnsName {
    std::string value;
};

/// @brief iPAddress entry (4 octets for IPv4, 16 for IPv6)
struct IpAddress {
    std::string text;
    std::vector<uint8_t> octets;
};

/// @brief uniformResourceIdentifier entry
struct UriName {
    std::string value;
    std::string scheme;
};

using SubjectAltName = std::variant<DnsName, IpAddress, UriName>;

/**
 * @brief Parse one prefixed SAN entry
 *
 * @param entry e.g. "DNS:www.example.com", "IP:127.0.0.1", "URI:spiffe://workload"
 * @return Typed SAN
 * @throws common::InvalidSanException for an unknown prefix, an empty value,
 *         an unparseable IP address or a malformed URI
 */
SubjectAltName parseSubjectAltName(const std::string& entry);

/**
 * @brief Format a typed SAN back to its prefixed form
 */
std::string subjectAltNameToString(const SubjectAltName& san);

/**
 * @brief Convert typed SANs to an OpenSSL GENERAL_NAMES stack
 *
 * @return GENERAL_NAMES (caller must free with GENERAL_NAMES_free), or nullptr on allocation failure
 */
GENERAL_NAMES* toGeneralNames(const std::vector<SubjectAltName>& sans);

} // namespace x509
} // namespace pkiforge
