/**
 * @file crl_builder.cpp
 * @brief X.509 v2 CRL construction implementation
 */

#include "pkiforge/x509/crl_builder.h"
#include "pkiforge/x509/key_generator.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/time_utils.h"

namespace pkiforge {
namespace x509 {

namespace {
    UniqueAsn1Integer decimalToAsn1(const std::string& decimal) {
        BIGNUM* raw = nullptr;
        if (decimal.empty() || BN_dec2bn(&raw, decimal.c_str()) != static_cast<int>(decimal.size())) {
            BN_free(raw);
            throw common::CryptoException("Invalid revoked serial number \"" + decimal + "\"");
        }
        UniqueBignum bn(raw);
        UniqueAsn1Integer value(BN_to_ASN1_INTEGER(bn.get(), nullptr));
        if (!value) {
            throw common::CryptoException("Failed to encode serial number: " + drainOpenSslErrors());
        }
        return value;
    }
}

UniqueCrl buildCrl(
    X509* issuerCert,
    EVP_PKEY* issuerKey,
    const std::vector<RevokedCertificate>& revoked,
    const utils::TimePoint& thisUpdate,
    const utils::TimePoint& nextUpdate)
{
    if (!issuerCert || !issuerKey) {
        throw common::CryptoException("CRL issuer certificate and key are required");
    }

    UniqueCrl crl(X509_CRL_new());
    if (!crl || X509_CRL_set_version(crl.get(), 1) != 1) {  // v2
        throw common::CryptoException("Failed to allocate CRL: " + drainOpenSslErrors());
    }

    if (X509_CRL_set_issuer_name(crl.get(), X509_get_subject_name(issuerCert)) != 1) {
        throw common::CryptoException("Failed to set CRL issuer: " + drainOpenSslErrors());
    }

    UniqueAsn1Time lastUpdate(utils::timePointToAsn1Time(thisUpdate));
    UniqueAsn1Time next(utils::timePointToAsn1Time(nextUpdate));
    if (!lastUpdate || !next ||
        X509_CRL_set1_lastUpdate(crl.get(), lastUpdate.get()) != 1 ||
        X509_CRL_set1_nextUpdate(crl.get(), next.get()) != 1) {
        throw common::CryptoException("Failed to set CRL validity: " + drainOpenSslErrors());
    }

    for (const auto& entry : revoked) {
        X509_REVOKED* rev = X509_REVOKED_new();
        if (!rev) {
            throw common::CryptoException("Failed to allocate revoked entry");
        }

        UniqueAsn1Integer serial = decimalToAsn1(entry.serialNumber);
        UniqueAsn1Time revDate(utils::timePointToAsn1Time(entry.revocationTime));
        if (!revDate ||
            X509_REVOKED_set_serialNumber(rev, serial.get()) != 1 ||
            X509_REVOKED_set_revocationDate(rev, revDate.get()) != 1 ||
            X509_CRL_add0_revoked(crl.get(), rev) != 1) {
            X509_REVOKED_free(rev);
            throw common::CryptoException("Failed to add revoked entry " + entry.serialNumber + ": " +
                                          drainOpenSslErrors());
        }
    }

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuerCert, nullptr, nullptr, crl.get(), 0);
    UniqueExtension aki(X509V3_EXT_conf_nid(nullptr, &ctx, NID_authority_key_identifier,
                                            const_cast<char*>("keyid")));
    if (!aki || X509_CRL_add_ext(crl.get(), aki.get(), -1) != 1) {
        throw common::CryptoException("Failed to add CRL authorityKeyIdentifier: " + drainOpenSslErrors());
    }

    UniqueAsn1Integer crlNumber(ASN1_INTEGER_new());
    if (!crlNumber ||
        ASN1_INTEGER_set_int64(crlNumber.get(),
                               static_cast<int64_t>(utils::toTimeT(thisUpdate))) != 1 ||
        X509_CRL_add1_ext_i2d(crl.get(), NID_crl_number, crlNumber.get(), 0, X509V3_ADD_DEFAULT) != 1) {
        throw common::CryptoException("Failed to add cRLNumber: " + drainOpenSslErrors());
    }

    if (X509_CRL_sign(crl.get(), issuerKey, signatureDigestFor(issuerKey)) <= 0) {
        throw common::CryptoException("Failed to sign CRL: " + drainOpenSslErrors());
    }

    return crl;
}

} // namespace x509
} // namespace pkiforge
