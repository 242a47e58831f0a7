/**
 * @file certificate_parser.h
 * @brief PEM certificate and CRL parsing and serialization
 */

#pragma once

#include <string>
#include <optional>
#include <openssl/x509.h>
#include "pkiforge/x509/openssl_ptr.h"

namespace pkiforge {
namespace x509 {

/**
 * @brief Parse certificate from PEM string
 *
 * @param pem PEM-encoded certificate ("BEGIN CERTIFICATE")
 * @return Certificate, or nullptr on error
 */
UniqueCert parseCertificateFromPem(const std::string& pem);

/**
 * @brief Serialize certificate to PEM format
 * @throws common::CryptoException on encoding failure
 */
std::string certificateToPem(X509* cert);

/**
 * @brief Parse CRL from PEM string ("BEGIN X509 CRL")
 * @return CRL, or nullptr on error
 */
UniqueCrl parseCrlFromPem(const std::string& pem);

/**
 * @brief Serialize CRL to PEM format
 * @throws common::CryptoException on encoding failure
 */
std::string crlToPem(X509_CRL* crl);

/**
 * @brief Decimal representation of an ASN.1 INTEGER (e.g., certificate serial)
 * @return Decimal string, empty on error
 */
std::string asn1IntegerToDecimal(const ASN1_INTEGER* value);

} // namespace x509
} // namespace pkiforge
