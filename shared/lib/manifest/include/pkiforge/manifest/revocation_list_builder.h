/**
 * @file revocation_list_builder.h
 * @brief One certificate revocation list per issuing authority
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "pkiforge/manifest/certificate_issuer.h"
#include "pkiforge/manifest/dependency_resolver.h"
#include "pkiforge/manifest/types.h"
#include "pkiforge/utils/time_utils.h"
#include "pkiforge/x509/crl_builder.h"

namespace pkiforge::manifest {

/**
 * @brief Revoked entries of one authority, by manifest position
 */
struct RevocationGroup {
    size_t authorityIndex = 0;
    std::vector<size_t> revokedIndices;     ///< Manifest order
};

/**
 * @brief Revocation list content: issuer DN and ordered (serial, time) pairs
 */
struct RevocationEntry {
    std::string issuerDn;
    std::vector<x509::RevokedCertificate> entries;
};

/**
 * @brief Group revoked descriptors by their resolved issuer
 *
 * Groups are ordered by the authority's manifest position.
 *
 * @throws common::RevocationException if a self-signed entity is marked revoked
 */
std::vector<RevocationGroup> groupRevocations(const std::vector<CertificateDescriptor>& descriptors,
                                              const std::vector<ResolvedEntry>& resolved);

/**
 * @brief Reject manifests whose output files overlap
 *
 * Covers certificate and key files of every descriptor and the revocation
 * list file of every authority in @p groups, so a descriptor named
 * "<authority>-crl" cannot overwrite that authority's list.
 *
 * @throws common::ManifestException naming both owners of the shared file
 */
void checkOutputCollisions(const std::vector<CertificateDescriptor>& descriptors,
                           const std::vector<RevocationGroup>& groups);

/**
 * @brief Content fingerprint of a revocation list
 * @param authorityFingerprint Fingerprint of the issuing authority
 * @param memberFingerprints Fingerprints of the revoked entries, manifest order
 */
std::string revocationListFingerprint(const std::string& authorityFingerprint,
                                      const std::vector<std::string>& memberFingerprints);

/**
 * @brief Sign a revocation list
 *
 * thisUpdate is @p now, nextUpdate is now + 8760h.
 *
 * @throws common::CryptoException on signing failure
 */
x509::UniqueCrl buildRevocationList(const KeyMaterial& authority,
                                    const RevocationEntry& entry,
                                    const utils::TimePoint& now);

/**
 * @brief Write <authority-filename>-crl.pem
 * @return Written file name, relative to the destination directory
 */
std::string writeRevocationList(const std::string& destinationDir,
                                const CertificateDescriptor& authority,
                                X509_CRL* crl);

} // namespace pkiforge::manifest
