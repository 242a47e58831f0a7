/**
 * @file config_manager.h
 * @brief Run configuration for the pkiforge command-line tool
 *
 * Values set from command-line flags take precedence over PKIFORGE_*
 * environment variables, which take precedence over the caller's default.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pkiforge::common {

/**
 * @brief Where an effective configuration value came from
 */
enum class ConfigSource {
    FLAG,
    ENVIRONMENT,
    DEFAULT
};

std::string configSourceToString(ConfigSource source);

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> flags_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager() = default;

    std::optional<std::string> lookup(const std::string& key, ConfigSource* source) const;

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * @brief Effective value of a key
     * @param key Configuration key (one of the constants below)
     * @param defaultValue Returned when neither a flag nor the environment sets the key
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Source of the effective value of a key
     */
    ConfigSource sourceOf(const std::string& key) const;

    bool has(const std::string& key) const;

    /**
     * @brief Record a command-line value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Forget all command-line values
     */
    void clear();

    /**
     * @brief Log every known key with its effective value and source (debug level)
     */
    void logEffective() const;

    static const std::vector<std::string>& knownKeys();

    /// @name Configuration keys
    static constexpr const char* DESTINATION = "PKIFORGE_DESTINATION";
    static constexpr const char* STATE_FILE = "PKIFORGE_STATE_FILE";
    static constexpr const char* LOG_LEVEL = "PKIFORGE_LOG_LEVEL";
    static constexpr const char* LOG_FILE = "PKIFORGE_LOG_FILE";
    static constexpr const char* STALE_STATE = "PKIFORGE_STALE_STATE";
};

} // namespace pkiforge::common
