/**
 * @file certificate_builder.cpp
 * @brief X.509 v3 certificate construction and signing
 */

#include "pkiforge/x509/certificate_builder.h"
#include "pkiforge/x509/dn_parser.h"
#include "pkiforge/x509/key_generator.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/string_utils.h"
#include "pkiforge/utils/time_utils.h"

#include <openssl/rand.h>

namespace pkiforge {
namespace x509 {

namespace {

    UniqueAsn1Integer serialToAsn1(const std::string& decimal) {
        BIGNUM* raw = nullptr;
        if (decimal.empty() || BN_dec2bn(&raw, decimal.c_str()) != static_cast<int>(decimal.size())) {
            BN_free(raw);
            ERR_clear_error();
            throw common::ManifestException("invalid serial number \"" + decimal + "\"");
        }
        UniqueBignum bn(raw);
        if (BN_is_negative(bn.get())) {
            throw common::ManifestException("serial number must not be negative: " + decimal);
        }

        UniqueAsn1Integer serial(BN_to_ASN1_INTEGER(bn.get(), nullptr));
        if (!serial) {
            throw common::CryptoException("Failed to encode serial number: " + drainOpenSslErrors());
        }
        return serial;
    }

    void setTime(ASN1_TIME* target, const utils::TimePoint& tp, const char* what) {
        UniqueAsn1Time value(utils::timePointToAsn1Time(tp));
        if (!value || ASN1_STRING_copy(target, value.get()) != 1) {
            throw common::CryptoException(std::string("Failed to set ") + what + ": " + drainOpenSslErrors());
        }
    }

    void addConfExtension(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
        UniqueExtension ext(X509V3_EXT_conf_nid(nullptr, ctx, nid, const_cast<char*>(value.c_str())));
        if (!ext || X509_add_ext(cert, ext.get(), -1) != 1) {
            throw common::CryptoException(std::string("Failed to add ") + OBJ_nid2sn(nid) +
                                          " extension: " + drainOpenSslErrors());
        }
    }

    void addSubjectAltNames(X509* cert, const std::vector<SubjectAltName>& sans) {
        UniqueGeneralNames names(toGeneralNames(sans));
        if (!names ||
            X509_add1_ext_i2d(cert, NID_subject_alt_name, names.get(), 0, X509V3_ADD_DEFAULT) != 1) {
            throw common::CryptoException("Failed to add subjectAltName extension: " + drainOpenSslErrors());
        }
    }

    void addCrlDistributionPoints(X509* cert, const std::vector<std::string>& urls) {
        CRL_DIST_POINTS* points = sk_DIST_POINT_new_null();
        if (!points) {
            throw common::CryptoException("Failed to allocate distribution points");
        }

        bool ok = true;
        for (const auto& url : urls) {
            UniqueGeneralNames fullName(toGeneralNames({UriName{url, ""}}));
            DIST_POINT* point = DIST_POINT_new();
            DIST_POINT_NAME* pointName = DIST_POINT_NAME_new();
            if (!fullName || !point || !pointName) {
                DIST_POINT_free(point);
                DIST_POINT_NAME_free(pointName);
                ok = false;
                break;
            }
            pointName->type = 0;
            pointName->name.fullname = fullName.release();
            point->distpoint = pointName;
            if (!sk_DIST_POINT_push(points, point)) {
                DIST_POINT_free(point);
                ok = false;
                break;
            }
        }

        ok = ok && X509_add1_ext_i2d(cert, NID_crl_distribution_points, points, 0, X509V3_ADD_DEFAULT) == 1;
        CRL_DIST_POINTS_free(points);
        if (!ok) {
            throw common::CryptoException("Failed to add cRLDistributionPoints extension: " + drainOpenSslErrors());
        }
    }
}

std::string generateSerialNumber() {
    UniqueBignum bn(BN_new());
    if (!bn || BN_rand(bn.get(), 128, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1) {
        throw common::CryptoException("Failed to generate serial number: " + drainOpenSslErrors());
    }
    if (BN_is_zero(bn.get())) {
        BN_one(bn.get());
    }

    char* dec = BN_bn2dec(bn.get());
    if (!dec) {
        throw common::CryptoException("Failed to format serial number");
    }
    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

UniqueCert buildCertificate(
    const CertificateTemplate& tmpl,
    EVP_PKEY* subjectKey,
    X509* issuerCert,
    EVP_PKEY* issuerKey)
{
    if (!subjectKey) {
        throw common::CryptoException("Subject key is required");
    }
    if ((issuerCert == nullptr) != (issuerKey == nullptr)) {
        throw common::CryptoException("Issuer certificate and issuer key must be given together");
    }

    UniqueName subject(parseDnString(tmpl.subjectDn));
    if (!subject) {
        throw common::ManifestException("invalid subject \"" + tmpl.subjectDn + "\"");
    }

    UniqueCert cert(X509_new());
    if (!cert || X509_set_version(cert.get(), 2) != 1) {  // v3
        throw common::CryptoException("Failed to allocate certificate: " + drainOpenSslErrors());
    }

    UniqueAsn1Integer serial = serialToAsn1(tmpl.serialNumber);
    if (X509_set_serialNumber(cert.get(), serial.get()) != 1) {
        throw common::CryptoException("Failed to set serial number: " + drainOpenSslErrors());
    }

    X509_NAME* issuerName = issuerCert ? X509_get_subject_name(issuerCert) : subject.get();
    if (X509_set_subject_name(cert.get(), subject.get()) != 1 ||
        X509_set_issuer_name(cert.get(), issuerName) != 1) {
        throw common::CryptoException("Failed to set names: " + drainOpenSslErrors());
    }

    setTime(X509_getm_notBefore(cert.get()), tmpl.notBefore, "notBefore");
    setTime(X509_getm_notAfter(cert.get()), tmpl.notAfter, "notAfter");

    if (X509_set_pubkey(cert.get(), subjectKey) != 1) {
        throw common::CryptoException("Failed to set public key: " + drainOpenSslErrors());
    }

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuerCert ? issuerCert : cert.get(), cert.get(), nullptr, nullptr, 0);

    addConfExtension(cert.get(), &ctx, NID_basic_constraints,
                     tmpl.isCa ? "critical,CA:TRUE" : "critical,CA:FALSE");

    if (!tmpl.keyUsages.empty()) {
        std::vector<std::string> names;
        for (auto usage : tmpl.keyUsages) {
            names.push_back(keyUsageOpenSslName(usage));
        }
        addConfExtension(cert.get(), &ctx, NID_key_usage, "critical," + utils::join(names, ","));
    }

    if (!tmpl.extKeyUsages.empty()) {
        std::vector<std::string> names;
        for (auto usage : tmpl.extKeyUsages) {
            names.push_back(extKeyUsageOpenSslName(usage));
        }
        addConfExtension(cert.get(), &ctx, NID_ext_key_usage, utils::join(names, ","));
    }

    addConfExtension(cert.get(), &ctx, NID_subject_key_identifier, "hash");
    if (issuerCert) {
        addConfExtension(cert.get(), &ctx, NID_authority_key_identifier, "keyid");
    }

    if (!tmpl.subjectAltNames.empty()) {
        addSubjectAltNames(cert.get(), tmpl.subjectAltNames);
    }
    if (!tmpl.crlDistributionPoints.empty()) {
        addCrlDistributionPoints(cert.get(), tmpl.crlDistributionPoints);
    }

    EVP_PKEY* signingKey = issuerKey ? issuerKey : subjectKey;
    if (X509_sign(cert.get(), signingKey, signatureDigestFor(signingKey)) <= 0) {
        throw common::CryptoException("Failed to sign certificate \"" + tmpl.subjectDn + "\": " +
                                      drainOpenSslErrors());
    }

    return cert;
}

} // namespace x509
} // namespace pkiforge
