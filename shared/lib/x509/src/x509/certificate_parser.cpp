/**
 * @file certificate_parser.cpp
 * @brief PEM certificate and CRL parsing implementation
 */

#include "pkiforge/x509/certificate_parser.h"
#include "pkiforge/common/exceptions.h"

#include <openssl/pem.h>

namespace pkiforge {
namespace x509 {

UniqueCert parseCertificateFromPem(const std::string& pem) {
    if (pem.empty()) {
        return nullptr;
    }

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }

    UniqueCert cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        ERR_clear_error();
    }
    return cert;
}

std::string certificateToPem(X509* cert) {
    if (!cert) {
        throw common::CryptoException("Cannot encode null certificate");
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw common::CryptoException("Failed to write certificate to PEM: " + drainOpenSslErrors());
    }
    return bioToString(bio.get());
}

UniqueCrl parseCrlFromPem(const std::string& pem) {
    if (pem.empty()) {
        return nullptr;
    }

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }

    UniqueCrl crl(PEM_read_bio_X509_CRL(bio.get(), nullptr, nullptr, nullptr));
    if (!crl) {
        ERR_clear_error();
    }
    return crl;
}

std::string crlToPem(X509_CRL* crl) {
    if (!crl) {
        throw common::CryptoException("Cannot encode null CRL");
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509_CRL(bio.get(), crl) != 1) {
        throw common::CryptoException("Failed to write CRL to PEM: " + drainOpenSslErrors());
    }
    return bioToString(bio.get());
}

std::string asn1IntegerToDecimal(const ASN1_INTEGER* value) {
    if (!value) {
        return "";
    }

    UniqueBignum bn(ASN1_INTEGER_to_BN(value, nullptr));
    if (!bn) {
        return "";
    }

    char* dec = BN_bn2dec(bn.get());
    if (!dec) {
        return "";
    }
    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

} // namespace x509
} // namespace pkiforge
