/**
 * @file key_usage.h
 * @brief Key usage and extended key usage flags (RFC 5280 4.2.1.3 / 4.2.1.12)
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace pkiforge {
namespace x509 {

/// @brief keyUsage bits
enum class KeyUsage {
    DigitalSignature,
    ContentCommitment,  ///< a.k.a. nonRepudiation
    KeyEncipherment,
    DataEncipherment,
    KeyAgreement,
    CertSign,
    CRLSign,
    EncipherOnly,
    DecipherOnly
};

/// @brief extendedKeyUsage purposes
enum class ExtKeyUsage {
    Any,
    ServerAuth,
    ClientAuth,
    CodeSigning,
    EmailProtection,
    IPSECEndSystem,
    IPSECTunnel,
    IPSECUser,
    TimeStamping,
    OCSPSigning,
    MicrosoftServerGatedCrypto,
    NetscapeServerGatedCrypto,
    MicrosoftCommercialCodeSigning,
    MicrosoftKernelCodeSigning
};

/**
 * @brief Parse manifest key usage name (e.g., "CertSign"), case-insensitive
 */
std::optional<KeyUsage> parseKeyUsage(const std::string& name);

/**
 * @brief Manifest name of a key usage
 */
std::string keyUsageName(KeyUsage usage);

/**
 * @brief OpenSSL configuration name (e.g., "keyCertSign")
 */
std::string keyUsageOpenSslName(KeyUsage usage);

/**
 * @brief Parse manifest extended key usage name (e.g., "ServerAuth"), case-insensitive
 */
std::optional<ExtKeyUsage> parseExtKeyUsage(const std::string& name);

/**
 * @brief Manifest name of an extended key usage
 */
std::string extKeyUsageName(ExtKeyUsage usage);

/**
 * @brief OpenSSL short name or dotted OID for an extended key usage
 */
std::string extKeyUsageOpenSslName(ExtKeyUsage usage);

/**
 * @brief Default key usages
 *
 * CA: {CertSign, CRLSign}; end entity: {KeyEncipherment, DigitalSignature}.
 */
std::vector<KeyUsage> defaultKeyUsages(bool isCa);

} // namespace x509
} // namespace pkiforge
