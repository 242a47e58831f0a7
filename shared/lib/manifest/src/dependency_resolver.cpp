/**
 * @file dependency_resolver.cpp
 * @brief Issuer reference resolution implementation
 */

#include "pkiforge/manifest/dependency_resolver.h"
#include "pkiforge/common/exceptions.h"

#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

ResolvedEntry DependencyResolver::resolve(const CertificateDescriptor& desc) {
    ResolvedEntry entry;
    entry.index = next_;

    if (filenames_.count(desc.filename) != 0) {
        throw common::ManifestException("duplicate filename \"" + desc.filename + "\" (subject \"" +
                                        desc.subject + "\")");
    }

    if (!desc.isSelfSigned()) {
        auto it = bySubject_.find(desc.issuer);
        if (it == bySubject_.end()) {
            throw common::UnresolvedIssuerException(desc.subject, desc.issuer);
        }
        entry.issuerIndex = it->second;
    }

    filenames_.insert(desc.filename);
    bySubject_[desc.subject] = entry.index;
    ++next_;

    spdlog::trace("Resolved {} -> {}", desc.subject,
                  entry.issuerIndex ? "#" + std::to_string(*entry.issuerIndex + 1) : "self-signed");
    return entry;
}

std::vector<ResolvedEntry> DependencyResolver::resolveAll(const std::vector<CertificateDescriptor>& descriptors) {
    std::vector<ResolvedEntry> result;
    result.reserve(descriptors.size());
    for (const auto& desc : descriptors) {
        result.push_back(resolve(desc));
    }
    return result;
}

} // namespace pkiforge::manifest
