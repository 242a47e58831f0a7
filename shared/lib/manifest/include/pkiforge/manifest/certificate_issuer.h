/**
 * @file certificate_issuer.h
 * @brief Key pair and certificate production for manifest entries
 *
 * Turns a CertificateDescriptor into an x509::CertificateTemplate, generates
 * the key pair, signs with the issuer's key material and writes the PEM
 * files. Key material of entries skipped in this run is read back from the
 * destination directory when a descendant or revocation list needs it.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "pkiforge/utils/time_utils.h"
#include "pkiforge/manifest/types.h"
#include "pkiforge/x509/certificate_builder.h"
#include "pkiforge/x509/openssl_ptr.h"

namespace pkiforge::manifest {

/**
 * @brief Certificate and private key of one entity
 */
struct KeyMaterial {
    x509::UniqueCert certificate;
    x509::UniqueKey key;
};

/**
 * @brief Resolved validity window
 */
struct ValidityWindow {
    utils::TimePoint notBefore;
    utils::TimePoint notAfter;
};

/**
 * @brief Resolve the validity window of a descriptor
 *
 * not_before defaults to @p now. not_after is the explicit value if set,
 * else now + expires, else now + 8760h.
 *
 * @throws common::ManifestException if not_after is not later than not_before
 */
ValidityWindow resolveValidity(const CertificateDescriptor& desc,
                               const utils::TimePoint& now);

/**
 * @brief Build the certificate template for a descriptor
 *
 * Applies validity resolution, default key usages and a random serial number
 * when none is pinned.
 */
x509::CertificateTemplate makeTemplate(const CertificateDescriptor& desc,
                                       const utils::TimePoint& now);

/**
 * @brief Generate a key pair and a signed certificate
 * @param desc Descriptor
 * @param issuer Issuer key material, nullptr for self-signed entries
 * @param now Reference time
 * @throws common::CryptoException on key generation or signing failure
 */
KeyMaterial issueCertificate(const CertificateDescriptor& desc,
                             const KeyMaterial* issuer,
                             const utils::TimePoint& now);

/**
 * @brief Write <filename>.pem and <filename>-key.pem
 * @return Written file names, relative to the destination directory
 * @throws common::FilesystemException on write failure
 */
std::vector<std::string> writeKeyMaterial(const std::string& destinationDir,
                                          const CertificateDescriptor& desc,
                                          const KeyMaterial& material);

/**
 * @brief Read certificate and key of a previously generated entity
 * @throws common::FilesystemException if either file is missing or unparseable
 */
KeyMaterial loadKeyMaterial(const std::string& destinationDir,
                            const CertificateDescriptor& desc);

} // namespace pkiforge::manifest
