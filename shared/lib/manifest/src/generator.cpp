/**
 * @file generator.cpp
 * @brief Incremental certificate generation run implementation
 */

#include "pkiforge/manifest/generator.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/manifest/certificate_issuer.h"
#include "pkiforge/manifest/dependency_resolver.h"
#include "pkiforge/manifest/fingerprint_engine.h"
#include "pkiforge/manifest/manifest_loader.h"
#include "pkiforge/manifest/revocation_list_builder.h"
#include "pkiforge/manifest/state_store.h"
#include "pkiforge/utils/file_utils.h"
#include "pkiforge/utils/string_utils.h"
#include "pkiforge/x509/certificate_parser.h"
#include "pkiforge/x509/key_generator.h"

#include <filesystem>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

namespace {

void checkDestination(const std::string& destinationDir) {
    if (!utils::directoryExists(destinationDir)) {
        throw common::FilesystemException("destination directory does not exist: " + destinationDir);
    }
}

/**
 * @brief Per-run key material cache, filled lazily from disk for skipped entries
 */
class MaterialCache {
public:
    MaterialCache(const std::vector<CertificateDescriptor>& descriptors, std::string destinationDir)
        : descriptors_(descriptors),
          destinationDir_(std::move(destinationDir)),
          materials_(descriptors.size()) {}

    void store(size_t index, KeyMaterial material) {
        materials_[index] = std::move(material);
    }

    const KeyMaterial& get(size_t index) {
        auto& slot = materials_[index];
        if (!slot) {
            slot = loadKeyMaterial(destinationDir_, descriptors_[index]);
        }
        return *slot;
    }

private:
    const std::vector<CertificateDescriptor>& descriptors_;
    std::string destinationDir_;
    std::vector<std::optional<KeyMaterial>> materials_;
};

} // anonymous namespace

CertificateGenerator::CertificateGenerator(GenerateOptions options)
    : options_(std::move(options)) {}

GenerationResult CertificateGenerator::generate(const std::vector<CertificateDescriptor>& descriptors,
                                                const ManifestState& previous) const {
    const std::string& destinationDir = options_.destinationDir;
    checkDestination(destinationDir);

    const auto now = options_.now.value_or(utils::currentTime());

    // Validation and change detection: nothing is written before this completes
    DependencyResolver resolver;
    std::vector<ResolvedEntry> resolved;
    resolved.reserve(descriptors.size());
    for (const auto& desc : descriptors) {
        resolved.push_back(resolver.resolve(desc));
        x509::validateKeySpec(desc.keySpec);
        resolveValidity(desc, now);
    }
    std::vector<RevocationGroup> groups = groupRevocations(descriptors, resolved);
    checkOutputCollisions(descriptors, groups);

    FingerprintEngine engine(previous, destinationDir);
    std::vector<Decision> decisions;
    decisions.reserve(descriptors.size());
    for (const auto& entry : resolved) {
        std::string issuerFingerprint;
        bool issuerRegenerated = false;
        if (entry.issuerIndex) {
            issuerFingerprint = decisions[*entry.issuerIndex].fingerprint;
            issuerRegenerated = decisions[*entry.issuerIndex].action == Action::REGENERATE;
        }
        decisions.push_back(engine.evaluate(descriptors[entry.index], issuerFingerprint, issuerRegenerated));
    }

    std::vector<Decision> crlDecisions;
    for (const auto& group : groups) {
        const Decision& authority = decisions[group.authorityIndex];
        bool changed = authority.action == Action::REGENERATE;
        std::vector<std::string> memberFingerprints;
        for (size_t member : group.revokedIndices) {
            memberFingerprints.push_back(decisions[member].fingerprint);
            changed = changed || decisions[member].action == Action::REGENERATE;
        }
        crlDecisions.push_back(engine.evaluateRevocationList(
            descriptors[group.authorityIndex],
            revocationListFingerprint(authority.fingerprint, memberFingerprints),
            changed));
    }

    // Certificates
    GenerationResult result;
    MaterialCache cache(descriptors, destinationDir);

    for (const auto& entry : resolved) {
        const CertificateDescriptor& desc = descriptors[entry.index];
        const Decision& decision = decisions[entry.index];

        EntityOutcome outcome;
        outcome.key = decision.key;
        outcome.fingerprint = decision.fingerprint;
        outcome.action = decision.action;

        if (decision.action == Action::REGENERATE) {
            const KeyMaterial* issuer = entry.issuerIndex ? &cache.get(*entry.issuerIndex) : nullptr;
            KeyMaterial material = issueCertificate(desc, issuer, now);
            outcome.writtenFiles = writeKeyMaterial(destinationDir, desc, material);
            spdlog::info("Writing: {}", utils::join(outcome.writtenFiles, " "));
            cache.store(entry.index, std::move(material));
        }
        result.certificates.push_back(std::move(outcome));
    }

    // Revocation lists
    for (size_t i = 0; i < groups.size(); i++) {
        const RevocationGroup& group = groups[i];
        const Decision& decision = crlDecisions[i];
        const CertificateDescriptor& authority = descriptors[group.authorityIndex];

        EntityOutcome outcome;
        outcome.key = decision.key;
        outcome.fingerprint = decision.fingerprint;
        outcome.action = decision.action;

        if (decision.action == Action::REGENERATE) {
            RevocationEntry content;
            content.issuerDn = authority.subject;
            for (size_t member : group.revokedIndices) {
                const KeyMaterial& revoked = cache.get(member);
                content.entries.push_back({
                    x509::asn1IntegerToDecimal(X509_get0_serialNumber(revoked.certificate.get())),
                    now
                });
            }

            x509::UniqueCrl crl = buildRevocationList(cache.get(group.authorityIndex), content, now);
            outcome.writtenFiles.push_back(writeRevocationList(destinationDir, authority, crl.get()));
            spdlog::info("Writing: {} ({} revoked)", outcome.writtenFiles.front(), content.entries.size());
        }
        result.revocationLists.push_back(std::move(outcome));
    }

    result.state = engine.finalState(options_.stalePolicy);

    spdlog::debug("Run complete: {} of {} certificates regenerated", result.regeneratedCount(),
                  result.certificates.size());
    return result;
}

std::string defaultStatePath(const std::string& manifestPath, const std::string& destinationDir) {
    std::string stem = std::filesystem::path(manifestPath).stem().string();
    if (stem.empty()) {
        stem = "certs";
    }
    return utils::joinPath(destinationDir, stem + ".state");
}

GenerationResult runManifest(const std::string& manifestPath,
                             const std::string& statePath,
                             const GenerateOptions& options) {
    checkDestination(options.destinationDir);

    std::vector<CertificateDescriptor> descriptors = loadManifestFile(manifestPath);
    spdlog::debug("Loaded {} certificate descriptors from {}", descriptors.size(), manifestPath);

    std::string effectiveStatePath = statePath.empty()
        ? defaultStatePath(manifestPath, options.destinationDir)
        : statePath;
    ManifestState previous = loadState(effectiveStatePath);

    CertificateGenerator generator(options);
    GenerationResult result = generator.generate(descriptors, previous);

    saveState(effectiveStatePath, result.state);
    return result;
}

} // namespace pkiforge::manifest
