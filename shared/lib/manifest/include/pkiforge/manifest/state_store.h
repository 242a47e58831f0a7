/**
 * @file state_store.h
 * @brief Persisted fingerprint table
 *
 * The state file is a flat JSON object mapping entity key to fingerprint:
 * @code
 *   {
 *       "root" : "9f2c...",
 *       "leaf" : "03ab...",
 *       "root-crl" : "77d1..."
 *   }
 * @endcode
 */

#pragma once

#include <string>
#include "pkiforge/manifest/types.h"

namespace pkiforge::manifest {

/**
 * @brief Parse state document text
 * @throws common::FilesystemException if the text is not a JSON object of strings
 */
ManifestState parseState(const std::string& text, const std::string& origin = "state");

/**
 * @brief Serialize state to JSON text
 */
std::string serializeState(const ManifestState& state);

/**
 * @brief Load the previous run's state
 *
 * A missing file is the first run and yields an empty state.
 *
 * @throws common::FilesystemException if the file exists but cannot be read or parsed
 */
ManifestState loadState(const std::string& path);

/**
 * @brief Replace the state file
 * @throws common::FilesystemException on write failure
 */
void saveState(const std::string& path, const ManifestState& state);

} // namespace pkiforge::manifest
