/**
 * @file state_store.cpp
 * @brief Persisted fingerprint table implementation
 */

#include "pkiforge/manifest/state_store.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/file_utils.h"

#include <sstream>

#include <json/json.h>
#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

ManifestState parseState(const std::string& text, const std::string& origin) {
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);

    if (!Json::parseFromStream(reader, stream, &root, &errors)) {
        throw common::FilesystemException("cannot parse " + origin + ": " + errors);
    }
    if (!root.isObject()) {
        throw common::FilesystemException(origin + " is not a JSON object");
    }

    ManifestState state;
    for (const auto& key : root.getMemberNames()) {
        const Json::Value& value = root[key];
        if (!value.isString()) {
            throw common::FilesystemException(origin + ": fingerprint for \"" + key + "\" is not a string");
        }
        state[key] = value.asString();
    }
    return state;
}

std::string serializeState(const ManifestState& state) {
    Json::Value root(Json::objectValue);
    for (const auto& [key, fingerprint] : state) {
        root[key] = fingerprint;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, root) + "\n";
}

ManifestState loadState(const std::string& path) {
    if (!utils::fileExists(path)) {
        spdlog::debug("No state file at {}, starting fresh", path);
        return {};
    }
    ManifestState state = parseState(utils::readFile(path), path);
    spdlog::debug("Loaded {} state entries from {}", state.size(), path);
    return state;
}

void saveState(const std::string& path, const ManifestState& state) {
    utils::writeFile(path, serializeState(state));
    spdlog::debug("Saved {} state entries to {}", state.size(), path);
}

} // namespace pkiforge::manifest
