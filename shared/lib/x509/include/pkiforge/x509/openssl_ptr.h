/**
 * @file openssl_ptr.h
 * @brief RAII wrappers for OpenSSL objects
 */

#pragma once

#include <memory>
#include <string>
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace pkiforge {
namespace x509 {

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct PKeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
using UniqueKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

struct CrlDeleter { void operator()(X509_CRL* p) const { X509_CRL_free(p); } };
using UniqueCrl = std::unique_ptr<X509_CRL, CrlDeleter>;

struct NameDeleter { void operator()(X509_NAME* p) const { X509_NAME_free(p); } };
using UniqueName = std::unique_ptr<X509_NAME, NameDeleter>;

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

struct BignumDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
using UniqueBignum = std::unique_ptr<BIGNUM, BignumDeleter>;

struct Asn1IntegerDeleter { void operator()(ASN1_INTEGER* p) const { ASN1_INTEGER_free(p); } };
using UniqueAsn1Integer = std::unique_ptr<ASN1_INTEGER, Asn1IntegerDeleter>;

struct Asn1TimeDeleter { void operator()(ASN1_TIME* p) const { ASN1_TIME_free(p); } };
using UniqueAsn1Time = std::unique_ptr<ASN1_TIME, Asn1TimeDeleter>;

struct GeneralNameDeleter { void operator()(GENERAL_NAME* p) const { GENERAL_NAME_free(p); } };
using UniqueGeneralName = std::unique_ptr<GENERAL_NAME, GeneralNameDeleter>;

struct GeneralNamesDeleter { void operator()(GENERAL_NAMES* p) const { GENERAL_NAMES_free(p); } };
using UniqueGeneralNames = std::unique_ptr<GENERAL_NAMES, GeneralNamesDeleter>;

struct ExtensionDeleter { void operator()(X509_EXTENSION* p) const { X509_EXTENSION_free(p); } };
using UniqueExtension = std::unique_ptr<X509_EXTENSION, ExtensionDeleter>;

/**
 * @brief Drain the OpenSSL error queue into one message
 * @return "; "-joined error strings, or "unknown OpenSSL error" if the queue is empty
 */
inline std::string drainOpenSslErrors() {
    std::string result;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) {
            result += "; ";
        }
        result += buf;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
}

/**
 * @brief Read the full contents of a memory BIO
 */
inline std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) {
        return "";
    }
    return std::string(data, static_cast<size_t>(len));
}

} // namespace x509
} // namespace pkiforge
