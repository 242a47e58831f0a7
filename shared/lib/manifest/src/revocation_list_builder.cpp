/**
 * @file revocation_list_builder.cpp
 * @brief Revocation list grouping and signing
 */

#include "pkiforge/manifest/revocation_list_builder.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/file_utils.h"
#include "pkiforge/utils/string_utils.h"
#include "pkiforge/x509/certificate_parser.h"

#include <map>

#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

std::vector<RevocationGroup> groupRevocations(const std::vector<CertificateDescriptor>& descriptors,
                                              const std::vector<ResolvedEntry>& resolved) {
    std::map<size_t, std::vector<size_t>> byAuthority;

    for (const auto& entry : resolved) {
        const CertificateDescriptor& desc = descriptors.at(entry.index);
        if (!desc.revoked) {
            continue;
        }
        if (entry.isSelfSigned()) {
            throw common::RevocationException("cannot revoke self-signed certificate \"" + desc.subject +
                                              "\": it has no issuing authority");
        }
        byAuthority[*entry.issuerIndex].push_back(entry.index);
    }

    std::vector<RevocationGroup> groups;
    for (auto& [authority, members] : byAuthority) {
        RevocationGroup group;
        group.authorityIndex = authority;
        group.revokedIndices = std::move(members);
        groups.push_back(std::move(group));
    }
    return groups;
}

void checkOutputCollisions(const std::vector<CertificateDescriptor>& descriptors,
                           const std::vector<RevocationGroup>& groups) {
    std::map<std::string, std::string> owners;
    auto claim = [&owners](const std::string& file, const std::string& owner) {
        auto [it, inserted] = owners.emplace(file, owner);
        if (!inserted) {
            throw common::ManifestException("output file \"" + file + "\" of " + owner +
                                            " collides with " + it->second);
        }
    };

    for (const auto& desc : descriptors) {
        claim(desc.certificateFile(), "\"" + desc.subject + "\"");
        claim(desc.keyFile(), "\"" + desc.subject + "\"");
    }
    for (const auto& group : groups) {
        const CertificateDescriptor& authority = descriptors.at(group.authorityIndex);
        claim(authority.crlFile(), "revocation list of \"" + authority.subject + "\"");
    }
}

std::string revocationListFingerprint(const std::string& authorityFingerprint,
                                      const std::vector<std::string>& memberFingerprints) {
    return utils::sha256Hex(authorityFingerprint + ":" + utils::join(memberFingerprints, ","));
}

x509::UniqueCrl buildRevocationList(const KeyMaterial& authority,
                                    const RevocationEntry& entry,
                                    const utils::TimePoint& now) {
    auto nextUpdate = utils::addDuration(now, kDefaultExpiry);
    if (!nextUpdate) {
        throw common::RevocationException("next update of revocation list for \"" + entry.issuerDn +
                                          "\" ends after 9999-12-31T23:59:59Z");
    }
    x509::UniqueCrl crl = x509::buildCrl(authority.certificate.get(), authority.key.get(),
                                         entry.entries, now, *nextUpdate);
    spdlog::debug("Signed revocation list for {} with {} entries", entry.issuerDn, entry.entries.size());
    return crl;
}

std::string writeRevocationList(const std::string& destinationDir,
                                const CertificateDescriptor& authority,
                                X509_CRL* crl) {
    utils::writeFile(utils::joinPath(destinationDir, authority.crlFile()), x509::crlToPem(crl), 0644);
    return authority.crlFile();
}

} // namespace pkiforge::manifest
