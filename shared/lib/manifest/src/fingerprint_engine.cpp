/**
 * @file fingerprint_engine.cpp
 * @brief Change detection implementation
 */

#include "pkiforge/manifest/fingerprint_engine.h"
#include "pkiforge/utils/file_utils.h"
#include "pkiforge/utils/string_utils.h"
#include "pkiforge/utils/time_utils.h"

#include <algorithm>
#include <utility>

#include <json/json.h>
#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

namespace {

Json::Value sortedArray(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    Json::Value array(Json::arrayValue);
    for (const auto& v : values) {
        array.append(v);
    }
    return array;
}

std::string optionalTime(const std::optional<utils::TimePoint>& tp) {
    return tp ? utils::formatIso8601(*tp) : std::string();
}

} // anonymous namespace

std::string canonicalizeDescriptor(const CertificateDescriptor& desc) {
    Json::Value root(Json::objectValue);

    root["subject"] = desc.subject;
    root["issuer"] = desc.issuer;
    root["filename"] = desc.filename;
    root["ca"] = desc.isCa;
    root["revoked"] = desc.revoked;
    root["key_type"] = x509::keyTypeToString(desc.keySpec.type);
    root["key_size"] = desc.keySpec.bits;
    root["expires"] = desc.expires ? std::to_string(desc.expires->count()) : std::string();
    root["not_before"] = optionalTime(desc.notBefore);
    root["not_after"] = optionalTime(desc.notAfter);
    root["serial"] = desc.serialNumber.value_or("");

    std::vector<std::string> sans;
    for (const auto& san : desc.subjectAltNames) {
        sans.push_back(x509::subjectAltNameToString(san));
    }
    root["sans"] = sortedArray(std::move(sans));

    std::vector<std::string> usages;
    for (auto usage : desc.keyUsages.value_or(x509::defaultKeyUsages(desc.isCa))) {
        usages.push_back(x509::keyUsageName(usage));
    }
    root["key_usages"] = sortedArray(std::move(usages));

    std::vector<std::string> extUsages;
    for (auto usage : desc.extKeyUsages) {
        extUsages.push_back(x509::extKeyUsageName(usage));
    }
    root["ext_key_usages"] = sortedArray(std::move(extUsages));

    root["crl_distribution_points"] = sortedArray(desc.crlDistributionPoints);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

std::string computeDescriptorFingerprint(const CertificateDescriptor& desc,
                                         const std::string& issuerFingerprint) {
    return utils::sha256Hex(canonicalizeDescriptor(desc) + issuerFingerprint);
}

// --- FingerprintEngine ---

FingerprintEngine::FingerprintEngine(ManifestState previous, std::string destinationDir)
    : previous_(std::move(previous)),
      destinationDir_(std::move(destinationDir)) {}

Decision FingerprintEngine::evaluate(const CertificateDescriptor& desc,
                                     const std::string& issuerFingerprint,
                                     bool issuerRegenerated) {
    std::string fingerprint = computeDescriptorFingerprint(desc, issuerFingerprint);
    Decision decision = decide(desc.filename, fingerprint,
                               {desc.certificateFile(), desc.keyFile()},
                               issuerRegenerated, "issuer is regenerated");

    if (decision.action == Action::SKIP) {
        spdlog::info("No changes for {}, skipping", decision.key);
    } else {
        spdlog::debug("Regenerating {}: {} (fingerprint {})", decision.key, decision.reason, fingerprint);
    }
    return decision;
}

Decision FingerprintEngine::evaluateRevocationList(const CertificateDescriptor& authority,
                                                   const std::string& contentFingerprint,
                                                   bool membersChanged) {
    Decision decision = decide(authority.filename + kCrlStateSuffix, contentFingerprint,
                               {authority.crlFile()},
                               membersChanged, "authority or revoked certificate is regenerated");

    if (decision.action == Action::SKIP) {
        spdlog::info("No changes for {}, skipping", decision.key);
    } else {
        spdlog::debug("Rebuilding {}: {}", decision.key, decision.reason);
    }
    return decision;
}

Decision FingerprintEngine::decide(const std::string& key,
                                   const std::string& fingerprint,
                                   const std::vector<std::string>& expectedFiles,
                                   bool forced,
                                   const std::string& forcedReason) {
    Decision decision;
    decision.key = key;
    decision.fingerprint = fingerprint;
    decision.action = Action::REGENERATE;

    next_[key] = fingerprint;

    auto it = previous_.find(key);
    if (it == previous_.end()) {
        decision.reason = "no previous state";
        return decision;
    }
    if (it->second != fingerprint) {
        decision.reason = "configuration changed";
        return decision;
    }
    if (forced) {
        decision.reason = forcedReason;
        return decision;
    }
    for (const auto& file : expectedFiles) {
        if (!utils::fileExists(utils::joinPath(destinationDir_, file))) {
            decision.reason = file + " is missing";
            return decision;
        }
    }

    decision.action = Action::SKIP;
    return decision;
}

ManifestState FingerprintEngine::finalState(StalePolicy policy) const {
    ManifestState state = next_;
    for (const auto& [key, fingerprint] : previous_) {
        if (next_.count(key) != 0) {
            continue;
        }
        if (policy == StalePolicy::RETAIN) {
            spdlog::warn("Retaining stale state entry {}", key);
            state[key] = fingerprint;
        } else {
            spdlog::warn("Pruning stale state entry {}", key);
        }
    }
    return state;
}

} // namespace pkiforge::manifest
