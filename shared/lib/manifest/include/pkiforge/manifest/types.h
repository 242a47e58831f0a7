/**
 * @file types.h
 * @brief Common types for the manifest generation engine
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pkiforge/utils/time_utils.h"
#include "pkiforge/x509/key_generator.h"
#include "pkiforge/x509/key_usage.h"
#include "pkiforge/x509/subject_alt_name.h"

namespace pkiforge::manifest {

/// @brief Default certificate lifetime when neither not_after nor expires is given
constexpr std::chrono::hours kDefaultExpiry{8760};

/// @brief File name suffixes
constexpr const char* kCertificateSuffix = ".pem";
constexpr const char* kKeySuffix = "-key.pem";
constexpr const char* kCrlSuffix = "-crl.pem";

/// @brief State key suffix for revocation list records
constexpr const char* kCrlStateSuffix = "-crl";

/**
 * @brief One normalized certificate specification
 *
 * Produced by the ManifestLoader with deterministic defaults applied
 * (key size, CA flag, filename). Immutable once loaded.
 */
struct CertificateDescriptor {
    std::string subject;                                    ///< Distinguished name
    std::vector<x509::SubjectAltName> subjectAltNames;
    x509::KeySpec keySpec;
    std::optional<std::chrono::seconds> expires;            ///< Relative lifetime
    std::optional<utils::TimePoint> notBefore;
    std::optional<utils::TimePoint> notAfter;
    std::optional<std::vector<x509::KeyUsage>> keyUsages;   ///< nullopt => CA / end-entity defaults
    std::vector<x509::ExtKeyUsage> extKeyUsages;
    std::string issuer;                                     ///< Empty => self-signed
    std::string filename;                                   ///< Output basename
    bool isCa = false;
    std::optional<std::string> serialNumber;                ///< Pinned decimal serial
    bool revoked = false;
    std::vector<std::string> crlDistributionPoints;

    bool isSelfSigned() const { return issuer.empty(); }
    std::string certificateFile() const { return filename + kCertificateSuffix; }
    std::string keyFile() const { return filename + kKeySuffix; }
    std::string crlFile() const { return filename + kCrlSuffix; }
};

/// @brief Fingerprint table: entity key (filename) -> fingerprint
using ManifestState = std::map<std::string, std::string>;

/// @brief What to do with state entries that have no descriptor in the current manifest
enum class StalePolicy {
    PRUNE,      ///< Drop them (default)
    RETAIN      ///< Carry them over unchanged
};

/// @brief Per-entity decision
enum class Action {
    SKIP,
    REGENERATE
};

/**
 * @brief Outcome for one manifest entry or revocation list
 */
struct EntityOutcome {
    std::string key;            ///< Filename (certificate) or "<filename>-crl" (revocation list)
    std::string fingerprint;
    Action action = Action::SKIP;
    std::vector<std::string> writtenFiles;
};

/**
 * @brief Result of one generation run
 */
struct GenerationResult {
    ManifestState state;                    ///< State to persist
    std::vector<EntityOutcome> certificates;
    std::vector<EntityOutcome> revocationLists;

    /**
     * @brief Number of certificates regenerated in this run
     */
    size_t regeneratedCount() const {
        size_t count = 0;
        for (const auto& outcome : certificates) {
            if (outcome.action == Action::REGENERATE) {
                ++count;
            }
        }
        return count;
    }
};

/**
 * @brief Run parameters
 */
struct GenerateOptions {
    std::string destinationDir = ".";
    StalePolicy stalePolicy = StalePolicy::PRUNE;
    /// Reference time for relative validity; std::nullopt uses the wall clock
    std::optional<utils::TimePoint> now;
};

/// @brief Convert Action to string
inline std::string actionToString(Action a) {
    switch (a) {
        case Action::SKIP:       return "SKIP";
        case Action::REGENERATE: return "REGENERATE";
    }
    return "UNKNOWN";
}

/// @brief Parse stale policy name ("prune" / "retain")
inline std::optional<StalePolicy> parseStalePolicy(const std::string& name) {
    if (name == "prune") return StalePolicy::PRUNE;
    if (name == "retain") return StalePolicy::RETAIN;
    return std::nullopt;
}

} // namespace pkiforge::manifest
