/**
 * @file pkiforge.cpp
 * @brief Command-line front end for the certificate generation engine
 *
 * Generates the certificates, keys and revocation lists described by a
 * manifest, regenerating only the entries whose configuration changed or
 * whose output files are missing.
 *
 * Usage:
 *   ./pkiforge [--destination DIR] [--state FILE] [--log-level LEVEL]
 *              [--retain-stale] [MANIFEST]
 *
 * Exit codes: 0 success, 1 generation error, 2 usage error.
 */

#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "pkiforge/common/config_manager.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/common/logger.h"
#include "pkiforge/manifest/generator.h"
#include "pkiforge/manifest/types.h"

using pkiforge::common::ConfigManager;

namespace {

constexpr const char* kDefaultManifest = "certs.json";

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [MANIFEST]\n";
    std::cout << "  MANIFEST                 Manifest file (default: " << kDefaultManifest << ")\n";
    std::cout << "  -d, --destination DIR    Output directory (default: .)\n";
    std::cout << "  --state FILE             State file (default: <DIR>/<manifest>.state)\n";
    std::cout << "  --log-level LEVEL        trace, debug, info, warn, error (default: info)\n";
    std::cout << "  --retain-stale           Keep state entries of removed manifest entries\n";
    std::cout << "  -h, --help               Show this help\n";
    std::cout << "\nEnvironment: PKIFORGE_DESTINATION, PKIFORGE_STATE_FILE, PKIFORGE_LOG_LEVEL,\n";
    std::cout << "             PKIFORGE_LOG_FILE, PKIFORGE_STALE_STATE (prune|retain)\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = ConfigManager::getInstance();
    std::string manifestPath = kDefaultManifest;
    bool manifestGiven = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--destination" || arg == "-d") && i + 1 < argc) {
            config.set(ConfigManager::DESTINATION, argv[++i]);
        } else if (arg == "--state" && i + 1 < argc) {
            config.set(ConfigManager::STATE_FILE, argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.set(ConfigManager::LOG_LEVEL, argv[++i]);
        } else if (arg == "--retain-stale") {
            config.set(ConfigManager::STALE_STATE, "retain");
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else if (!manifestGiven) {
            manifestPath = arg;
            manifestGiven = true;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    std::string logFile = config.getString(ConfigManager::LOG_FILE);
    pkiforge::common::Logger::initialize("pkiforge",
                                         config.getString(ConfigManager::LOG_LEVEL, "info"),
                                         !logFile.empty(), logFile);
    config.logEffective();

    pkiforge::manifest::GenerateOptions options;
    options.destinationDir = config.getString(ConfigManager::DESTINATION, ".");

    std::string staleName = config.getString(ConfigManager::STALE_STATE, "prune");
    auto policy = pkiforge::manifest::parseStalePolicy(staleName);
    if (!policy) {
        spdlog::error("Invalid stale state policy: {} (expected prune or retain)", staleName);
        return 2;
    }
    options.stalePolicy = *policy;

    try {
        auto result = pkiforge::manifest::runManifest(manifestPath,
                                                      config.getString(ConfigManager::STATE_FILE),
                                                      options);
        spdlog::info("Done: {} of {} certificates regenerated",
                     result.regeneratedCount(), result.certificates.size());
    } catch (const pkiforge::common::PkiforgeException& e) {
        spdlog::error("[{}] {}", e.getCode(), e.what());
        pkiforge::common::Logger::flush();
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        pkiforge::common::Logger::flush();
        return 1;
    }

    pkiforge::common::Logger::flush();
    return 0;
}
