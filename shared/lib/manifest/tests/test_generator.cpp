/**
 * @file test_generator.cpp
 * @brief End-to-end tests for incremental certificate generation
 */

#include <gtest/gtest.h>
#include <pkiforge/common/exceptions.h>
#include <pkiforge/manifest/generator.h>
#include <pkiforge/manifest/manifest_loader.h>
#include <pkiforge/manifest/state_store.h>
#include <pkiforge/utils/file_utils.h>
#include <pkiforge/x509/dn_parser.h>
#include "test_helpers.h"

#include <filesystem>
#include <map>
#include <stdexcept>

#include <openssl/evp.h>

using namespace pkiforge::manifest;
using namespace pkiforge::common;
using pkiforge::utils::readFile;
using pkiforge::utils::writeFile;
using pkiforge::x509::getCommonName;

// ============================================================================
// Test Fixture
// ============================================================================

class GeneratorTest : public ::testing::Test {
protected:
    test_helpers::TempDir dir_;

    GenerationResult run(const std::string& manifest, const ManifestState& previous = {},
                         StalePolicy policy = StalePolicy::PRUNE) {
        GenerateOptions options;
        options.destinationDir = dir_.path();
        options.stalePolicy = policy;
        return CertificateGenerator(options).generate(parseManifest(manifest), previous);
    }

    std::map<std::string, std::string> snapshot() const {
        std::map<std::string, std::string> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir_.path())) {
            files[entry.path().filename().string()] = readFile(entry.path().string());
        }
        return files;
    }

    size_t fileCount() const {
        size_t count = 0;
        for (auto it = std::filesystem::directory_iterator(dir_.path());
             it != std::filesystem::directory_iterator(); ++it) {
            count++;
        }
        return count;
    }

    static const EntityOutcome& outcome(const GenerationResult& result, const std::string& key) {
        for (const auto& o : result.certificates) {
            if (o.key == key) return o;
        }
        for (const auto& o : result.revocationLists) {
            if (o.key == key) return o;
        }
        throw std::runtime_error("no outcome for " + key);
    }
};

const char* kRootAndLeaf = R"([
    {"subject": "cn=root"},
    {"subject": "cn=leaf", "issuer": "cn=root", "sans": ["DNS:leaf.example.com"]}
])";

const char* kThreeEntities = R"([
    {"subject": "cn=root"},
    {"subject": "cn=leaf1", "issuer": "cn=root"},
    {"subject": "cn=leaf2", "issuer": "cn=root"}
])";

// ============================================================================
// End-to-end scenario
// ============================================================================

TEST_F(GeneratorTest, RootAndLeaf) {
    auto result = run(kRootAndLeaf);

    for (const char* name : {"root.pem", "root-key.pem", "leaf.pem", "leaf-key.pem"}) {
        EXPECT_TRUE(dir_.exists(name)) << name;
    }
    EXPECT_EQ(result.regeneratedCount(), 2u);
    EXPECT_EQ(outcome(result, "root").writtenFiles, (std::vector<std::string>{"root.pem", "root-key.pem"}));

    auto leaf = test_helpers::loadCert(dir_.file("leaf.pem"));
    auto root = test_helpers::loadCert(dir_.file("root.pem"));
    ASSERT_NE(leaf, nullptr);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(getCommonName(X509_get_issuer_name(leaf.get())), "root");
    EXPECT_EQ(getCommonName(X509_get_subject_name(leaf.get())), "leaf");
    EXPECT_EQ(test_helpers::dnsNames(leaf.get()), std::vector<std::string>{"leaf.example.com"});

    EXPECT_EQ(X509_verify(leaf.get(), X509_get0_pubkey(root.get())), 1);
    EXPECT_GE(X509_check_ca(root.get()), 1);
    EXPECT_EQ(X509_check_ca(leaf.get()), 0);

    EXPECT_EQ(result.state.size(), 2u);
    EXPECT_EQ(result.state.count("root"), 1u);
    EXPECT_EQ(result.state.count("leaf"), 1u);
}

// ============================================================================
// Idempotence
// ============================================================================

TEST_F(GeneratorTest, SecondRunWritesNothing) {
    auto first = run(kRootAndLeaf);
    auto before = snapshot();

    auto second = run(kRootAndLeaf, first.state);

    EXPECT_EQ(second.regeneratedCount(), 0u);
    for (const auto& o : second.certificates) {
        EXPECT_EQ(o.action, Action::SKIP) << o.key;
        EXPECT_TRUE(o.writtenFiles.empty()) << o.key;
    }
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(second.state, first.state);
}

// ============================================================================
// Ancestor propagation
// ============================================================================

TEST_F(GeneratorTest, IssuerChangeRegeneratesDescendants) {
    auto first = run(kRootAndLeaf);

    auto second = run(R"([
        {"subject": "cn=root", "expires": "2h"},
        {"subject": "cn=leaf", "issuer": "cn=root", "sans": ["DNS:leaf.example.com"]}
    ])", first.state);

    EXPECT_EQ(outcome(second, "root").action, Action::REGENERATE);
    EXPECT_EQ(outcome(second, "leaf").action, Action::REGENERATE);
    EXPECT_NE(second.state.at("leaf"), first.state.at("leaf"));

    auto leaf = test_helpers::loadCert(dir_.file("leaf.pem"));
    auto root = test_helpers::loadCert(dir_.file("root.pem"));
    EXPECT_EQ(X509_verify(leaf.get(), X509_get0_pubkey(root.get())), 1);
}

TEST_F(GeneratorTest, LeafChangeLeavesIssuerAlone) {
    auto first = run(kRootAndLeaf);
    std::string rootPem = readFile(dir_.file("root.pem"));

    auto second = run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=leaf", "issuer": "cn=root", "sans": ["DNS:leaf.example.com", "DNS:alt.example.com"]}
    ])", first.state);

    EXPECT_EQ(outcome(second, "root").action, Action::SKIP);
    EXPECT_EQ(outcome(second, "leaf").action, Action::REGENERATE);
    EXPECT_EQ(readFile(dir_.file("root.pem")), rootPem);

    // Signed with the issuer key read back from disk
    auto leaf = test_helpers::loadCert(dir_.file("leaf.pem"));
    auto root = test_helpers::loadCert(dir_.file("root.pem"));
    EXPECT_EQ(X509_verify(leaf.get(), X509_get0_pubkey(root.get())), 1);
}

TEST_F(GeneratorTest, NewEntryUnderSkippedIssuer) {
    auto first = run(kRootAndLeaf);
    auto second = run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=leaf", "issuer": "cn=root", "sans": ["DNS:leaf.example.com"]},
        {"subject": "cn=leaf2", "issuer": "cn=root"}
    ])", first.state);

    EXPECT_EQ(second.regeneratedCount(), 1u);
    EXPECT_EQ(outcome(second, "leaf2").action, Action::REGENERATE);

    auto leaf2 = test_helpers::loadCert(dir_.file("leaf2.pem"));
    auto root = test_helpers::loadCert(dir_.file("root.pem"));
    EXPECT_EQ(X509_verify(leaf2.get(), X509_get0_pubkey(root.get())), 1);
}

// ============================================================================
// Missing-file recovery
// ============================================================================

TEST_F(GeneratorTest, DeletedPairRegeneratesOnlyThatEntity) {
    auto first = run(kThreeEntities);
    dir_.remove("leaf1.pem");
    dir_.remove("leaf1-key.pem");
    std::string leaf2Pem = readFile(dir_.file("leaf2.pem"));

    auto second = run(kThreeEntities, first.state);

    EXPECT_EQ(outcome(second, "root").action, Action::SKIP);
    EXPECT_EQ(outcome(second, "leaf1").action, Action::REGENERATE);
    EXPECT_EQ(outcome(second, "leaf2").action, Action::SKIP);
    EXPECT_TRUE(dir_.exists("leaf1.pem"));
    EXPECT_TRUE(dir_.exists("leaf1-key.pem"));
    EXPECT_EQ(readFile(dir_.file("leaf2.pem")), leaf2Pem);
    EXPECT_EQ(second.state, first.state);
}

TEST_F(GeneratorTest, DeletedIssuerKeyRegeneratesChain) {
    auto first = run(kThreeEntities);
    dir_.remove("root-key.pem");

    auto second = run(kThreeEntities, first.state);
    EXPECT_EQ(second.regeneratedCount(), 3u);
}

// ============================================================================
// Validation before any write
// ============================================================================

TEST_F(GeneratorTest, UnresolvedIssuerWritesNoFiles) {
    EXPECT_THROW(run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=leaf", "issuer": "cn=nonexistent"}
    ])"), UnresolvedIssuerException);
    EXPECT_EQ(fileCount(), 0u);
}

TEST_F(GeneratorTest, InvalidKeySpecWritesNoFiles) {
    EXPECT_THROW(run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=leaf", "issuer": "cn=root", "key_type": "RSA", "key_size": 3072}
    ])"), InvalidKeySpecException);
    EXPECT_EQ(fileCount(), 0u);
}

TEST_F(GeneratorTest, DuplicateFilenameWritesNoFiles) {
    EXPECT_THROW(run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=other", "filename": "root"}
    ])"), ManifestException);
    EXPECT_EQ(fileCount(), 0u);
}

TEST_F(GeneratorTest, FilenameShadowingRevocationListWritesNoFiles) {
    EXPECT_THROW(run(R"([
        {"subject": "cn=ca1"},
        {"subject": "cn=x", "issuer": "cn=ca1", "revoked": true},
        {"subject": "cn=ca1-crl", "issuer": "cn=ca1"}
    ])"), ManifestException);
    EXPECT_EQ(fileCount(), 0u);
}

TEST_F(GeneratorTest, FilenameShadowingKeyFileWritesNoFiles) {
    EXPECT_THROW(run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=root-key", "issuer": "cn=root"}
    ])"), ManifestException);
    EXPECT_EQ(fileCount(), 0u);
}

TEST_F(GeneratorTest, ExpiresPastEndOfTimeWritesNoFiles) {
    EXPECT_THROW(run(R"([
        {"subject": "cn=root"},
        {"subject": "cn=leaf", "issuer": "cn=root", "expires": "70000000h"}
    ])"), ManifestException);
    EXPECT_EQ(fileCount(), 0u);
}

TEST_F(GeneratorTest, NotAfterAtEndOfTime) {
    auto result = run(R"([{"subject": "cn=root", "not_after": "9999-12-31T23:59:59Z"}])");
    EXPECT_EQ(outcome(result, "root").action, Action::REGENERATE);
    EXPECT_TRUE(dir_.exists("root.pem"));
}

TEST_F(GeneratorTest, InvalidDestinationThrows) {
    GenerateOptions options;
    options.destinationDir = dir_.file("does-not-exist");
    EXPECT_THROW(CertificateGenerator(options).generate(parseManifest(kRootAndLeaf), {}),
                 FilesystemException);
}

// ============================================================================
// Revocation
// ============================================================================

TEST_F(GeneratorTest, RevokedPinnedSerial) {
    auto result = run(R"([
        {"subject": "cn=ca1"},
        {"subject": "cn=revoked", "issuer": "cn=ca1", "serial": 123, "revoked": true}
    ])");

    ASSERT_TRUE(dir_.exists("ca1-crl.pem"));
    auto crl = test_helpers::loadCrl(dir_.file("ca1-crl.pem"));
    ASSERT_NE(crl, nullptr);
    EXPECT_EQ(test_helpers::revokedSerials(crl.get()), std::vector<std::string>{"123"});
    EXPECT_EQ(getCommonName(X509_CRL_get_issuer(crl.get())), "ca1");

    auto ca = test_helpers::loadCert(dir_.file("ca1.pem"));
    EXPECT_EQ(X509_CRL_verify(crl.get(), X509_get0_pubkey(ca.get())), 1);

    EXPECT_EQ(outcome(result, "ca1-crl").writtenFiles, std::vector<std::string>{"ca1-crl.pem"});
    EXPECT_EQ(result.state.count("ca1-crl"), 1u);
}

TEST_F(GeneratorTest, RevokedEntriesKeepManifestOrder) {
    run(R"([
        {"subject": "cn=ca1"},
        {"subject": "cn=ca2"},
        {"subject": "cn=a", "issuer": "cn=ca2", "serial": 123, "revoked": true},
        {"subject": "cn=b", "issuer": "cn=ca2", "serial": 456, "revoked": true},
        {"subject": "cn=c", "issuer": "cn=ca1", "serial": 789}
    ])");

    EXPECT_FALSE(dir_.exists("ca1-crl.pem"));
    auto crl = test_helpers::loadCrl(dir_.file("ca2-crl.pem"));
    ASSERT_NE(crl, nullptr);
    EXPECT_EQ(test_helpers::revokedSerials(crl.get()), (std::vector<std::string>{"123", "456"}));
}

TEST_F(GeneratorTest, RevokedRandomSerialMatchesCertificate) {
    run(R"([
        {"subject": "cn=ca1"},
        {"subject": "cn=revoked", "issuer": "cn=ca1", "revoked": true}
    ])");

    auto cert = test_helpers::loadCert(dir_.file("revoked.pem"));
    auto crl = test_helpers::loadCrl(dir_.file("ca1-crl.pem"));
    EXPECT_EQ(test_helpers::revokedSerials(crl.get()), std::vector<std::string>{test_helpers::serialOf(cert.get())});
}

TEST_F(GeneratorTest, RevocationListIsIdempotent) {
    const char* manifest = R"([
        {"subject": "cn=ca1"},
        {"subject": "cn=revoked", "issuer": "cn=ca1", "revoked": true}
    ])";
    auto first = run(manifest);
    auto before = snapshot();

    auto second = run(manifest, first.state);
    EXPECT_EQ(outcome(second, "ca1-crl").action, Action::SKIP);
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(second.state, first.state);
}

TEST_F(GeneratorTest, MissingRevocationListIsRebuiltAlone) {
    const char* manifest = R"([
        {"subject": "cn=ca1"},
        {"subject": "cn=revoked", "issuer": "cn=ca1", "serial": 123, "revoked": true}
    ])";
    auto first = run(manifest);
    dir_.remove("ca1-crl.pem");

    auto second = run(manifest, first.state);
    EXPECT_EQ(second.regeneratedCount(), 0u);
    EXPECT_EQ(outcome(second, "ca1-crl").action, Action::REGENERATE);
    EXPECT_TRUE(dir_.exists("ca1-crl.pem"));
}

TEST_F(GeneratorTest, RevokingSelfSignedThrows) {
    EXPECT_THROW(run(R"([{"subject": "cn=root", "revoked": true}])"), RevocationException);
    EXPECT_EQ(fileCount(), 0u);
}

// ============================================================================
// All fields
// ============================================================================

TEST_F(GeneratorTest, AllFields) {
    run(R"([
        {"subject": "cn=ca", "key_type": "RSA", "key_size": 2048, "expires": "2h"},
        {
            "subject": "CN=server,O=Example",
            "sans": ["DNS:server.example.com", "IP:127.0.0.1", "URI:https://server.example.com/id"],
            "key_type": "EC",
            "key_size": 384,
            "not_before": "2020-01-01T09:00:00Z",
            "not_after": "2030-01-01T09:00:00Z",
            "key_usages": ["DigitalSignature", "KeyAgreement"],
            "ext_key_usages": ["ServerAuth", "ClientAuth"],
            "issuer": "cn=ca",
            "filename": "web",
            "ca": false,
            "serial": 4242,
            "crl_distribution_points": ["http://example.com/ca.crl"]
        },
        {"subject": "cn=ed", "key_type": "ED25519", "issuer": "cn=ca", "ca": true}
    ])");

    auto web = test_helpers::loadCert(dir_.file("web.pem"));
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(test_helpers::serialOf(web.get()), "4242");
    EXPECT_EQ(X509_check_ca(web.get()), 0);
    EXPECT_EQ(EVP_PKEY_get_bits(X509_get0_pubkey(web.get())), 384);

    uint32_t ku = X509_get_key_usage(web.get());
    EXPECT_TRUE(ku & KU_DIGITAL_SIGNATURE);
    EXPECT_TRUE(ku & KU_KEY_AGREEMENT);
    EXPECT_FALSE(ku & KU_KEY_ENCIPHERMENT);

    uint32_t xku = X509_get_extended_key_usage(web.get());
    EXPECT_TRUE(xku & XKU_SSL_SERVER);
    EXPECT_TRUE(xku & XKU_SSL_CLIENT);

    EXPECT_EQ(ASN1_TIME_compare(X509_get0_notBefore(web.get()),
                                pkiforge::x509::UniqueAsn1Time(
                                    pkiforge::utils::timePointToAsn1Time(test_helpers::referenceTime())).get()),
              0);
    EXPECT_GE(X509_get_ext_by_NID(web.get(), NID_crl_distribution_points, -1), 0);

    auto ca = test_helpers::loadCert(dir_.file("ca.pem"));
    EXPECT_EQ(EVP_PKEY_get_base_id(X509_get0_pubkey(ca.get())), EVP_PKEY_RSA);
    EXPECT_EQ(X509_verify(web.get(), X509_get0_pubkey(ca.get())), 1);

    auto ed = test_helpers::loadCert(dir_.file("ed.pem"));
    EXPECT_EQ(EVP_PKEY_get_base_id(X509_get0_pubkey(ed.get())), EVP_PKEY_ED25519);
    EXPECT_GE(X509_check_ca(ed.get()), 1);
}

// ============================================================================
// Stale state entries
// ============================================================================

TEST_F(GeneratorTest, RemovedEntryPrunedFromState) {
    auto first = run(kThreeEntities);
    auto second = run(kRootAndLeaf, first.state, StalePolicy::PRUNE);

    EXPECT_EQ(second.state.count("leaf1"), 0u);
    EXPECT_EQ(second.state.count("leaf2"), 0u);
    EXPECT_EQ(second.state.count("leaf"), 1u);
}

TEST_F(GeneratorTest, RemovedEntryRetainedInState) {
    auto first = run(kThreeEntities);
    auto second = run(kRootAndLeaf, first.state, StalePolicy::RETAIN);

    EXPECT_EQ(second.state.at("leaf1"), first.state.at("leaf1"));
    EXPECT_EQ(second.state.at("leaf2"), first.state.at("leaf2"));
    EXPECT_EQ(second.state.count("leaf"), 1u);
}

// ============================================================================
// runManifest
// ============================================================================

TEST_F(GeneratorTest, RunManifestPersistsState) {
    writeFile(dir_.file("certs.json"), kRootAndLeaf);
    GenerateOptions options;
    options.destinationDir = dir_.path();

    auto first = runManifest(dir_.file("certs.json"), "", options);
    EXPECT_EQ(first.regeneratedCount(), 2u);
    ASSERT_TRUE(dir_.exists("certs.state"));
    EXPECT_EQ(loadState(dir_.file("certs.state")), first.state);

    auto second = runManifest(dir_.file("certs.json"), "", options);
    EXPECT_EQ(second.regeneratedCount(), 0u);
}

TEST_F(GeneratorTest, RunManifestExplicitStatePath) {
    writeFile(dir_.file("certs.json"), kRootAndLeaf);
    GenerateOptions options;
    options.destinationDir = dir_.path();

    runManifest(dir_.file("certs.json"), dir_.file("custom.state"), options);
    EXPECT_TRUE(dir_.exists("custom.state"));
    EXPECT_FALSE(dir_.exists("certs.state"));
}

TEST_F(GeneratorTest, RunManifestMissingManifest) {
    GenerateOptions options;
    options.destinationDir = dir_.path();
    EXPECT_THROW(runManifest(dir_.file("missing.json"), "", options), FilesystemException);
}

TEST_F(GeneratorTest, RunManifestFailureKeepsPreviousState) {
    writeFile(dir_.file("certs.json"), kRootAndLeaf);
    GenerateOptions options;
    options.destinationDir = dir_.path();
    auto first = runManifest(dir_.file("certs.json"), "", options);

    writeFile(dir_.file("certs.json"), R"([{"subject": "cn=leaf", "issuer": "cn=missing"}])");
    EXPECT_THROW(runManifest(dir_.file("certs.json"), "", options), UnresolvedIssuerException);
    EXPECT_EQ(loadState(dir_.file("certs.state")), first.state);
}

TEST(DefaultStatePathTest, UsesManifestStem) {
    EXPECT_EQ(defaultStatePath("conf/certs.json", "out"), "out/certs.state");
    EXPECT_EQ(defaultStatePath("pki.json", "."), "./pki.state");
}
