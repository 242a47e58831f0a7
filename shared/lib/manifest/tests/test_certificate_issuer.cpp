/**
 * @file test_certificate_issuer.cpp
 * @brief Unit tests for descriptor to certificate conversion
 */

#include <gtest/gtest.h>
#include <pkiforge/common/exceptions.h>
#include <pkiforge/manifest/certificate_issuer.h>
#include <pkiforge/manifest/manifest_loader.h>
#include <pkiforge/utils/time_utils.h>
#include "test_helpers.h"

#include <filesystem>

using namespace pkiforge::manifest;
using namespace std::chrono;
using test_helpers::referenceTime;

namespace {
    CertificateDescriptor single(const std::string& json) {
        return parseManifest("[" + json + "]").at(0);
    }
}

// ============================================================================
// Validity
// ============================================================================

TEST(ValidityTest, DefaultsToOneYearFromNow) {
    auto window = resolveValidity(single(R"({"subject": "cn=a"})"), referenceTime());
    EXPECT_EQ(window.notBefore, referenceTime());
    EXPECT_EQ(window.notAfter, referenceTime() + hours(8760));
}

TEST(ValidityTest, ExpiresIsRelativeToNow) {
    auto window = resolveValidity(single(R"({"subject": "cn=a", "expires": "1h"})"), referenceTime());
    EXPECT_EQ(window.notAfter, referenceTime() + hours(1));
}

TEST(ValidityTest, NotAfterWinsOverExpires) {
    auto desc = single(R"({"subject": "cn=a", "expires": "1h", "not_after": "2021-01-01T00:00:00Z"})");
    auto window = resolveValidity(desc, referenceTime());
    EXPECT_EQ(window.notAfter, *pkiforge::utils::parseIso8601("2021-01-01T00:00:00Z"));
}

TEST(ValidityTest, ExplicitNotBefore) {
    auto desc = single(R"({"subject": "cn=a", "not_before": "2019-06-01T00:00:00Z"})");
    auto window = resolveValidity(desc, referenceTime());
    EXPECT_EQ(window.notBefore, *pkiforge::utils::parseIso8601("2019-06-01T00:00:00Z"));
    EXPECT_EQ(window.notAfter, referenceTime() + hours(8760));
}

TEST(ValidityTest, NotAfterAtEndOfTime) {
    auto desc = single(R"({"subject": "cn=a", "not_after": "9999-12-31T23:59:59Z"})");
    auto window = resolveValidity(desc, referenceTime());
    EXPECT_EQ(window.notAfter, pkiforge::utils::fromTimeT(pkiforge::utils::kMaxCertificateTime));

    KeyMaterial issued = issueCertificate(desc, nullptr, referenceTime());
    auto notAfter = pkiforge::utils::asn1TimeToTimePoint(X509_get0_notAfter(issued.certificate.get()));
    ASSERT_TRUE(notAfter.has_value());
    EXPECT_EQ(pkiforge::utils::toTimeT(*notAfter), pkiforge::utils::kMaxCertificateTime);
}

TEST(ValidityTest, ExpiresPastEndOfTimeThrows) {
    auto desc = single(R"({"subject": "cn=a", "expires": "70000000h"})");
    EXPECT_THROW(resolveValidity(desc, referenceTime()), pkiforge::common::ManifestException);
}

TEST(ValidityTest, InvertedWindowThrows) {
    auto desc = single(R"({"subject": "cn=a", "not_after": "2019-01-01T00:00:00Z"})");
    EXPECT_THROW(resolveValidity(desc, referenceTime()), pkiforge::common::ManifestException);
}

// ============================================================================
// Template
// ============================================================================

TEST(TemplateTest, DefaultsForCaAndEndEntity) {
    auto ca = makeTemplate(single(R"({"subject": "cn=ca"})"), referenceTime());
    EXPECT_TRUE(ca.isCa);
    EXPECT_EQ(ca.keyUsages, pkiforge::x509::defaultKeyUsages(true));
    EXPECT_FALSE(ca.serialNumber.empty());

    auto leaf = makeTemplate(single(R"({"subject": "cn=leaf", "issuer": "cn=ca"})"), referenceTime());
    EXPECT_FALSE(leaf.isCa);
    EXPECT_EQ(leaf.keyUsages, pkiforge::x509::defaultKeyUsages(false));
}

TEST(TemplateTest, PinnedSerialAndRandomSerial) {
    auto pinned = makeTemplate(single(R"({"subject": "cn=a", "serial": 123})"), referenceTime());
    EXPECT_EQ(pinned.serialNumber, "123");

    auto desc = single(R"({"subject": "cn=b"})");
    EXPECT_NE(makeTemplate(desc, referenceTime()).serialNumber, makeTemplate(desc, referenceTime()).serialNumber);
}

// ============================================================================
// Issue, write, load
// ============================================================================

TEST(CertificateIssuerTest, IssueWriteAndLoad) {
    test_helpers::TempDir dir;
    auto descriptors = parseManifest(R"([
        {"subject": "cn=root"},
        {"subject": "cn=leaf", "issuer": "cn=root", "sans": ["DNS:leaf.example.com"]}
    ])");

    KeyMaterial root = issueCertificate(descriptors[0], nullptr, referenceTime());
    KeyMaterial leaf = issueCertificate(descriptors[1], &root, referenceTime());
    EXPECT_EQ(X509_verify(leaf.certificate.get(), root.key.get()), 1);

    auto written = writeKeyMaterial(dir.path(), descriptors[1], leaf);
    EXPECT_EQ(written, (std::vector<std::string>{"leaf.pem", "leaf-key.pem"}));

    auto perms = std::filesystem::status(dir.file("leaf-key.pem")).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::group_read, std::filesystem::perms::none);

    KeyMaterial loaded = loadKeyMaterial(dir.path(), descriptors[1]);
    EXPECT_EQ(X509_cmp(loaded.certificate.get(), leaf.certificate.get()), 0);
    EXPECT_EQ(EVP_PKEY_eq(loaded.key.get(), leaf.key.get()), 1);
    EXPECT_EQ(test_helpers::dnsNames(loaded.certificate.get()), std::vector<std::string>{"leaf.example.com"});
}

TEST(CertificateIssuerTest, LoadMissingMaterialThrows) {
    test_helpers::TempDir dir;
    auto desc = single(R"({"subject": "cn=ghost"})");
    EXPECT_THROW(loadKeyMaterial(dir.path(), desc), pkiforge::common::FilesystemException);

    pkiforge::utils::writeFile(dir.file("ghost.pem"), "garbage");
    pkiforge::utils::writeFile(dir.file("ghost-key.pem"), "garbage");
    EXPECT_THROW(loadKeyMaterial(dir.path(), desc), pkiforge::common::FilesystemException);
}

TEST(CertificateIssuerTest, Ed25519AndRsaKeys) {
    auto ed = issueCertificate(single(R"({"subject": "cn=ed", "key_type": "ED25519"})"), nullptr, referenceTime());
    EXPECT_EQ(EVP_PKEY_get_base_id(ed.key.get()), EVP_PKEY_ED25519);

    auto rsa = issueCertificate(single(R"({"subject": "cn=rsa", "key_type": "RSA", "key_size": 1024})"),
                                nullptr, referenceTime());
    EXPECT_EQ(EVP_PKEY_get_bits(rsa.key.get()), 1024);
}
