/**
 * @file certificate_builder.h
 * @brief X.509 v3 certificate construction and signing
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <openssl/x509.h>
#include "pkiforge/utils/time_utils.h"
#include "pkiforge/x509/key_usage.h"
#include "pkiforge/x509/openssl_ptr.h"
#include "pkiforge/x509/subject_alt_name.h"

namespace pkiforge {
namespace x509 {

/**
 * @brief Fully resolved certificate contents
 *
 * Every field is final: defaults (validity, key usages, serial) are
 * applied by the caller before building.
 */
struct CertificateTemplate {
    std::string subjectDn;                              ///< e.g. "CN=leaf,O=Example"
    std::string serialNumber;                           ///< Decimal serial number
    utils::TimePoint notBefore;
    utils::TimePoint notAfter;
    bool isCa = false;
    std::vector<KeyUsage> keyUsages;                    ///< Empty omits the extension
    std::vector<ExtKeyUsage> extKeyUsages;              ///< Empty omits the extension
    std::vector<SubjectAltName> subjectAltNames;        ///< Empty omits the extension
    std::vector<std::string> crlDistributionPoints;     ///< Full-name URIs, one distribution point each
};

/**
 * @brief Generate a random positive serial number
 *
 * 128 random bits, as recommended for CA/B Forum compliant serials.
 *
 * @return Decimal string
 * @throws common::CryptoException if the PRNG fails
 */
std::string generateSerialNumber();

/**
 * @brief Build and sign a certificate
 *
 * When issuerCert/issuerKey are null the certificate is self-signed with
 * subjectKey. Otherwise the issuer name and authority key identifier are
 * taken from issuerCert and the signature is made with issuerKey.
 *
 * Extensions: basicConstraints (critical), keyUsage (critical),
 * extendedKeyUsage, subjectKeyIdentifier, authorityKeyIdentifier,
 * subjectAltName, cRLDistributionPoints.
 *
 * @throws common::ManifestException if subjectDn or serialNumber is malformed
 * @throws common::CryptoException on any OpenSSL failure
 */
UniqueCert buildCertificate(
    const CertificateTemplate& tmpl,
    EVP_PKEY* subjectKey,
    X509* issuerCert = nullptr,
    EVP_PKEY* issuerKey = nullptr
);

} // namespace x509
} // namespace pkiforge
