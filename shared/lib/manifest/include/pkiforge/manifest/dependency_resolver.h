/**
 * @file dependency_resolver.h
 * @brief Issuer reference resolution in manifest order
 *
 * Issuers must be declared before the certificates they sign, so a single
 * forward pass with a name -> entry map resolves every reference. Cycles
 * cannot be expressed: a reference that is not yet resolved at lookup
 * time is an error.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "pkiforge/manifest/types.h"

namespace pkiforge::manifest {

/**
 * @brief Resolution of one descriptor
 */
struct ResolvedEntry {
    size_t index = 0;                       ///< Position in the manifest
    std::optional<size_t> issuerIndex;      ///< Issuer position; std::nullopt when self-signed

    bool isSelfSigned() const { return !issuerIndex.has_value(); }
};

/**
 * @brief Resolves issuer references against already processed entries
 *
 * Usage:
 * @code
 *   DependencyResolver resolver;
 *   for (const auto& desc : descriptors) {
 *       ResolvedEntry entry = resolver.resolve(desc);
 *   }
 * @endcode
 */
class DependencyResolver {
public:
    /**
     * @brief Resolve the next descriptor in manifest order
     *
     * Looks up the issuer by exact distinguished-name match among the
     * descriptors resolved so far, then registers this descriptor so later
     * entries can reference it. When several earlier entries share a
     * subject, the most recent one is the issuer.
     *
     * @throws common::UnresolvedIssuerException if the issuer is not declared earlier
     * @throws common::ManifestException if the filename was already used
     */
    ResolvedEntry resolve(const CertificateDescriptor& desc);

    /**
     * @brief Resolve a whole manifest
     */
    std::vector<ResolvedEntry> resolveAll(const std::vector<CertificateDescriptor>& descriptors);

    /**
     * @brief Number of descriptors resolved so far
     */
    size_t size() const { return next_; }

private:
    std::map<std::string, size_t> bySubject_;
    std::set<std::string> filenames_;
    size_t next_ = 0;
};

} // namespace pkiforge::manifest
