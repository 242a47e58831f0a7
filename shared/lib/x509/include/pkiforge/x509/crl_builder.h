/**
 * @file crl_builder.h
 * @brief X.509 v2 certificate revocation list construction (RFC 5280 Section 5)
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <openssl/x509.h>
#include "pkiforge/utils/time_utils.h"
#include "pkiforge/x509/openssl_ptr.h"

namespace pkiforge {
namespace x509 {

/**
 * @brief One revokedCertificates entry
 */
struct RevokedCertificate {
    std::string serialNumber;                               ///< Decimal serial number
    utils::TimePoint revocationTime;
};

/**
 * @brief Build and sign a CRL
 *
 * Entries are written in the given order. The CRL carries an
 * authorityKeyIdentifier and a cRLNumber derived from thisUpdate.
 *
 * @param issuerCert Issuing authority certificate (non-owning)
 * @param issuerKey Issuing authority private key (non-owning)
 * @param revoked Revoked entries
 * @param thisUpdate CRL issue time
 * @param nextUpdate Next scheduled CRL issue time
 * @throws common::CryptoException on any OpenSSL failure
 */
UniqueCrl buildCrl(
    X509* issuerCert,
    EVP_PKEY* issuerKey,
    const std::vector<RevokedCertificate>& revoked,
    const utils::TimePoint& thisUpdate,
    const utils::TimePoint& nextUpdate
);

} // namespace x509
} // namespace pkiforge
