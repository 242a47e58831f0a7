/**
 * @file manifest_loader.h
 * @brief JSON manifest parsing into CertificateDescriptors
 *
 * Manifest shape: either a JSON array of certificate objects or an object
 * with a "certificates" array.
 *
 * @code
 * [
 *   { "subject": "cn=root" },
 *   { "subject": "cn=leaf", "issuer": "cn=root", "sans": ["DNS:leaf.example.com"] }
 * ]
 * @endcode
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>
#include "pkiforge/manifest/types.h"

namespace pkiforge::manifest {

/**
 * @brief Load and parse a manifest file
 *
 * @throws common::FilesystemException if the file cannot be read
 * @throws common::ManifestException for malformed JSON or invalid fields
 * @throws common::InvalidSanException / common::InvalidKeySpecException for bad values
 */
std::vector<CertificateDescriptor> loadManifestFile(const std::string& path);

/**
 * @brief Parse manifest text
 */
std::vector<CertificateDescriptor> parseManifest(const std::string& text);

/**
 * @brief Parse one certificate object
 *
 * Applies deterministic defaults: key type EC, key size per algorithm,
 * CA = true for self-signed entries, filename = subject CN.
 *
 * @param value JSON object
 * @param index Position in the manifest (for error messages)
 */
CertificateDescriptor parseDescriptor(const Json::Value& value, size_t index);

} // namespace pkiforge::manifest
