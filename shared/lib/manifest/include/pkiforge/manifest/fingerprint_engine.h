/**
 * @file fingerprint_engine.h
 * @brief Change detection for manifest entries and revocation lists
 *
 * A fingerprint is the SHA-256 of a descriptor's canonical JSON form
 * concatenated with its issuer's fingerprint, so a change anywhere up the
 * chain changes every descendant. The engine compares fingerprints with the
 * previous run's state and checks the expected output files to decide
 * between SKIP and REGENERATE.
 */

#pragma once

#include <string>
#include "pkiforge/manifest/types.h"

namespace pkiforge::manifest {

/**
 * @brief Canonical JSON text of a descriptor
 *
 * Keys are sorted, list fields (SANs, key usages, extended key usages,
 * distribution points) are sorted, timestamps are normalized to
 * YYYY-MM-DDTHH:MM:SSZ and durations to whole seconds. Unset key usages
 * are replaced by the CA / end-entity defaults.
 */
std::string canonicalizeDescriptor(const CertificateDescriptor& desc);

/**
 * @brief Fingerprint of a descriptor chained to its issuer
 * @param desc Descriptor
 * @param issuerFingerprint Issuer fingerprint, empty for self-signed entries
 * @return Lowercase hex SHA-256
 */
std::string computeDescriptorFingerprint(const CertificateDescriptor& desc,
                                         const std::string& issuerFingerprint);

/**
 * @brief Skip / regenerate decision
 */
struct Decision {
    std::string key;
    std::string fingerprint;
    Action action = Action::SKIP;
    std::string reason;             ///< Why REGENERATE was chosen, empty for SKIP
};

/**
 * @brief Compares fingerprints against the previous state
 *
 * Every evaluated entity is recorded in the next-state table regardless of
 * the outcome, so the persisted state always mirrors the current manifest.
 */
class FingerprintEngine {
public:
    FingerprintEngine(ManifestState previous, std::string destinationDir);

    /**
     * @brief Decide for one certificate entry
     * @param desc Descriptor
     * @param issuerFingerprint Issuer fingerprint, empty for self-signed entries
     * @param issuerRegenerated The issuer gets a new key this run
     */
    Decision evaluate(const CertificateDescriptor& desc,
                      const std::string& issuerFingerprint,
                      bool issuerRegenerated);

    /**
     * @brief Decide for the revocation list of an authority
     * @param authority Issuing authority descriptor
     * @param contentFingerprint Hash over the authority and its revoked members
     * @param membersChanged The authority or a revoked member is regenerated this run
     */
    Decision evaluateRevocationList(const CertificateDescriptor& authority,
                                    const std::string& contentFingerprint,
                                    bool membersChanged);

    /// @brief Fingerprints recorded during this run
    const ManifestState& nextState() const { return next_; }

    /**
     * @brief State to persist after the run
     *
     * PRUNE returns only the entries recorded in this run. RETAIN also carries
     * over previous entries without a counterpart in the current manifest.
     */
    ManifestState finalState(StalePolicy policy) const;

private:
    Decision decide(const std::string& key,
                    const std::string& fingerprint,
                    const std::vector<std::string>& expectedFiles,
                    bool forced,
                    const std::string& forcedReason);

    ManifestState previous_;
    ManifestState next_;
    std::string destinationDir_;
};

} // namespace pkiforge::manifest
