/**
 * @file config_manager.cpp
 * @brief Run configuration implementation
 */

#include "pkiforge/common/config_manager.h"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace pkiforge::common {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

std::string configSourceToString(ConfigSource source) {
    switch (source) {
        case ConfigSource::FLAG:        return "flag";
        case ConfigSource::ENVIRONMENT: return "environment";
        case ConfigSource::DEFAULT:     return "default";
    }
    return "unknown";
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key, ConfigSource* source) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = flags_.find(key);
    if (it != flags_.end()) {
        if (source) *source = ConfigSource::FLAG;
        return it->second;
    }
    if (const char* env = std::getenv(key.c_str())) {
        if (source) *source = ConfigSource::ENVIRONMENT;
        return std::string(env);
    }
    if (source) *source = ConfigSource::DEFAULT;
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key, nullptr).value_or(defaultValue);
}

ConfigSource ConfigManager::sourceOf(const std::string& key) const {
    ConfigSource source = ConfigSource::DEFAULT;
    lookup(key, &source);
    return source;
}

bool ConfigManager::has(const std::string& key) const {
    return lookup(key, nullptr).has_value();
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    flags_[key] = value;
}

void ConfigManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    flags_.clear();
}

void ConfigManager::logEffective() const {
    for (const auto& key : knownKeys()) {
        ConfigSource source = ConfigSource::DEFAULT;
        auto value = lookup(key, &source);
        spdlog::debug("{}={} ({})", key, value.value_or("<unset>"), configSourceToString(source));
    }
}

const std::vector<std::string>& ConfigManager::knownKeys() {
    static const std::vector<std::string> keys = {
        DESTINATION, STATE_FILE, LOG_LEVEL, LOG_FILE, STALE_STATE
    };
    return keys;
}

} // namespace pkiforge::common
