/**
 * @file test_helpers.h
 * @brief Shared test helpers for pkiforge::manifest unit tests
 *
 * Scratch destination directories and readers for generated PEM files.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <pkiforge/utils/file_utils.h>
#include <pkiforge/utils/time_utils.h>
#include <pkiforge/x509/certificate_parser.h>
#include <pkiforge/x509/openssl_ptr.h>

namespace test_helpers {

/// 2020-01-01T09:00:00Z
inline pkiforge::utils::TimePoint referenceTime() {
    return pkiforge::utils::fromTimeT(1577869200);
}

/**
 * @brief Scratch directory removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("pkiforge-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }
    bool exists(const std::string& name) const { return std::filesystem::exists(path_ / name); }
    void remove(const std::string& name) const { std::filesystem::remove(path_ / name); }

private:
    std::filesystem::path path_;
};

inline pkiforge::x509::UniqueCert loadCert(const std::string& path) {
    return pkiforge::x509::parseCertificateFromPem(pkiforge::utils::readFile(path));
}

inline pkiforge::x509::UniqueCrl loadCrl(const std::string& path) {
    return pkiforge::x509::parseCrlFromPem(pkiforge::utils::readFile(path));
}

inline std::string serialOf(X509* cert) {
    return pkiforge::x509::asn1IntegerToDecimal(X509_get0_serialNumber(cert));
}

/**
 * @brief Revoked serial numbers (decimal) in encoding order
 */
inline std::vector<std::string> revokedSerials(X509_CRL* crl) {
    std::vector<std::string> result;
    STACK_OF(X509_REVOKED)* revoked = X509_CRL_get_REVOKED(crl);
    for (int i = 0; i < sk_X509_REVOKED_num(revoked); i++) {
        result.push_back(pkiforge::x509::asn1IntegerToDecimal(
            X509_REVOKED_get0_serialNumber(sk_X509_REVOKED_value(revoked, i))));
    }
    return result;
}

/**
 * @brief DNS names from the subjectAltName extension
 */
inline std::vector<std::string> dnsNames(X509* cert) {
    std::vector<std::string> result;
    pkiforge::x509::UniqueGeneralNames names(static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr)));
    if (!names) {
        return result;
    }
    for (int i = 0; i < sk_GENERAL_NAME_num(names.get()); i++) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names.get(), i);
        if (name->type == GEN_DNS) {
            const ASN1_IA5STRING* dns = name->d.dNSName;
            result.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                                static_cast<size_t>(ASN1_STRING_length(dns)));
        }
    }
    return result;
}

} // namespace test_helpers
