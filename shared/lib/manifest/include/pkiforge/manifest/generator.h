/**
 * @file generator.h
 * @brief Incremental certificate generation run
 *
 * One run walks the manifest once in declaration order:
 *   1. resolve issuers, validate key specs and validity, compute fingerprints
 *      (no file is written until every entry passed this phase)
 *   2. issue certificates marked REGENERATE
 *   3. rebuild revocation lists whose content changed
 *   4. produce the state to persist
 *
 * The run is all-or-nothing at the semantic level but not transactional on
 * disk: files written before a failure remain, and the state file is only
 * replaced after overall success.
 */

#pragma once

#include <string>
#include <vector>
#include "pkiforge/manifest/types.h"

namespace pkiforge::manifest {

/**
 * @brief Runs the engine over a descriptor list
 *
 * Stateless between calls: the previous state goes in and the next state
 * comes out in the GenerationResult, so the generator can be invoked
 * repeatedly in one process.
 */
class CertificateGenerator {
public:
    explicit CertificateGenerator(GenerateOptions options);

    /**
     * @brief Generate certificates, keys and revocation lists
     * @param descriptors Manifest entries in declaration order
     * @param previous State of the last successful run
     * @throws common::PkiforgeException subclasses on any failure
     */
    GenerationResult generate(const std::vector<CertificateDescriptor>& descriptors,
                              const ManifestState& previous) const;

    const GenerateOptions& options() const { return options_; }

private:
    GenerateOptions options_;
};

/**
 * @brief Default state file: <destination>/<manifest stem>.state
 */
std::string defaultStatePath(const std::string& manifestPath, const std::string& destinationDir);

/**
 * @brief Full run: load manifest and state, generate, save state
 * @param manifestPath Manifest file
 * @param statePath State file, empty for defaultStatePath()
 * @param options Run parameters
 * @throws common::FilesystemException if the destination directory does not exist
 */
GenerationResult runManifest(const std::string& manifestPath,
                             const std::string& statePath,
                             const GenerateOptions& options);

} // namespace pkiforge::manifest
