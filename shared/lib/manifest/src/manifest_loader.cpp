/**
 * @file manifest_loader.cpp
 * @brief JSON manifest parsing implementation
 */

#include "pkiforge/manifest/manifest_loader.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/file_utils.h"
#include "pkiforge/utils/string_utils.h"
#include "pkiforge/utils/time_utils.h"
#include "pkiforge/x509/dn_parser.h"
#include "pkiforge/x509/openssl_ptr.h"

#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

namespace {

    const std::set<std::string> kKnownFields = {
        "subject", "sans", "key_type", "key_size", "expires", "not_before", "not_after",
        "key_usages", "ext_key_usages", "issuer", "filename", "ca", "serial", "revoked",
        "crl_distribution_points"
    };

    std::string where(size_t index, const std::string& field) {
        return "certificate #" + std::to_string(index + 1) + " field \"" + field + "\"";
    }

    std::string requireString(const Json::Value& value, size_t index, const std::string& field) {
        if (!value.isString()) {
            throw common::ManifestException(where(index, field) + " must be a string");
        }
        return value.asString();
    }

    bool requireBool(const Json::Value& value, size_t index, const std::string& field) {
        if (!value.isBool()) {
            throw common::ManifestException(where(index, field) + " must be a boolean");
        }
        return value.asBool();
    }

    std::vector<std::string> requireStringList(const Json::Value& value, size_t index, const std::string& field) {
        if (!value.isArray()) {
            throw common::ManifestException(where(index, field) + " must be an array of strings");
        }
        std::vector<std::string> result;
        for (const auto& item : value) {
            if (!item.isString()) {
                throw common::ManifestException(where(index, field) + " must be an array of strings");
            }
            result.push_back(item.asString());
        }
        return result;
    }

    utils::TimePoint requireTimestamp(const Json::Value& value, size_t index,
                                                           const std::string& field) {
        std::string text = requireString(value, index, field);
        auto tp = utils::parseIso8601(text);
        if (!tp) {
            throw common::ManifestException(where(index, field) +
                                            " is not an RFC 3339 timestamp up to 9999-12-31T23:59:59Z: " + text);
        }
        return *tp;
    }

    std::string parseSerial(const Json::Value& value, size_t index) {
        if (value.isIntegral() && !value.isBool()) {
            if (value.isUInt64()) {
                return std::to_string(value.asUInt64());
            }
            throw common::ManifestException(where(index, "serial") + " must not be negative");
        }
        if (value.isString()) {
            std::string text = utils::trim(value.asString());
            if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
                size_t firstNonZero = text.find_first_not_of('0');
                return firstNonZero == std::string::npos ? "0" : text.substr(firstNonZero);
            }
        }
        throw common::ManifestException(where(index, "serial") + " must be a non-negative integer");
    }

    bool isSafeFilename(const std::string& name) {
        return !name.empty() && name != "." && name != ".." &&
               name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
    }
}

CertificateDescriptor parseDescriptor(const Json::Value& value, size_t index) {
    if (!value.isObject()) {
        throw common::ManifestException("certificate #" + std::to_string(index + 1) + " must be an object");
    }

    for (const auto& name : value.getMemberNames()) {
        if (kKnownFields.count(name) == 0) {
            throw common::ManifestException("certificate #" + std::to_string(index + 1) +
                                            " has unknown field \"" + name + "\"");
        }
    }

    CertificateDescriptor desc;

    if (!value.isMember("subject")) {
        throw common::ManifestException("certificate #" + std::to_string(index + 1) + " is missing \"subject\"");
    }
    desc.subject = utils::trim(requireString(value["subject"], index, "subject"));
    x509::UniqueName subjectName(x509::parseDnString(desc.subject));
    if (!subjectName) {
        throw common::ManifestException(where(index, "subject") + " is not a distinguished name: " + desc.subject);
    }

    if (value.isMember("sans")) {
        for (const auto& entry : requireStringList(value["sans"], index, "sans")) {
            desc.subjectAltNames.push_back(x509::parseSubjectAltName(entry));
        }
    }

    if (value.isMember("key_type")) {
        std::string typeName = requireString(value["key_type"], index, "key_type");
        auto type = x509::parseKeyType(typeName);
        if (!type) {
            throw common::InvalidKeySpecException("unknown key type \"" + typeName + "\" in certificate #" +
                                                  std::to_string(index + 1) + " (expected EC, RSA or ED25519)");
        }
        desc.keySpec.type = *type;
    }
    desc.keySpec.bits = x509::defaultKeySize(desc.keySpec.type);
    if (value.isMember("key_size")) {
        const Json::Value& size = value["key_size"];
        if (!size.isInt() || size.isBool()) {
            throw common::ManifestException(where(index, "key_size") + " must be an integer");
        }
        if (desc.keySpec.type != x509::KeyType::ED25519) {
            desc.keySpec.bits = size.asInt();
        }
    }

    if (value.isMember("expires")) {
        std::string text = requireString(value["expires"], index, "expires");
        auto duration = utils::parseDuration(text);
        if (!duration) {
            throw common::ManifestException(where(index, "expires") + " is not a duration within range: " + text);
        }
        desc.expires = *duration;
    }
    if (value.isMember("not_before")) {
        desc.notBefore = requireTimestamp(value["not_before"], index, "not_before");
    }
    if (value.isMember("not_after")) {
        desc.notAfter = requireTimestamp(value["not_after"], index, "not_after");
    }

    if (value.isMember("key_usages")) {
        std::vector<x509::KeyUsage> usages;
        for (const auto& name : requireStringList(value["key_usages"], index, "key_usages")) {
            auto usage = x509::parseKeyUsage(name);
            if (!usage) {
                throw common::ManifestException(where(index, "key_usages") + " has unknown usage \"" + name + "\"");
            }
            usages.push_back(*usage);
        }
        desc.keyUsages = usages;
    }

    if (value.isMember("ext_key_usages")) {
        for (const auto& name : requireStringList(value["ext_key_usages"], index, "ext_key_usages")) {
            auto usage = x509::parseExtKeyUsage(name);
            if (!usage) {
                throw common::ManifestException(where(index, "ext_key_usages") +
                                                " has unknown usage \"" + name + "\"");
            }
            desc.extKeyUsages.push_back(*usage);
        }
    }

    if (value.isMember("issuer")) {
        desc.issuer = utils::trim(requireString(value["issuer"], index, "issuer"));
    }

    if (value.isMember("filename")) {
        desc.filename = utils::trim(requireString(value["filename"], index, "filename"));
    } else {
        auto cn = x509::getCommonName(subjectName.get());
        if (!cn || cn->empty()) {
            throw common::ManifestException("certificate #" + std::to_string(index + 1) +
                                            " has no \"filename\" and its subject has no CN: " + desc.subject);
        }
        desc.filename = *cn;
    }
    if (!isSafeFilename(desc.filename)) {
        throw common::ManifestException(where(index, "filename") + " is not a plain file name: " + desc.filename);
    }

    desc.isCa = value.isMember("ca") ? requireBool(value["ca"], index, "ca") : desc.isSelfSigned();

    if (value.isMember("serial")) {
        desc.serialNumber = parseSerial(value["serial"], index);
    }

    if (value.isMember("revoked")) {
        desc.revoked = requireBool(value["revoked"], index, "revoked");
    }

    if (value.isMember("crl_distribution_points")) {
        desc.crlDistributionPoints = requireStringList(value["crl_distribution_points"], index,
                                                       "crl_distribution_points");
    }

    return desc;
}

std::vector<CertificateDescriptor> parseManifest(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["allowComments"] = true;
    builder["rejectDupKeys"] = true;

    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw common::ManifestException("invalid JSON: " + utils::trim(errors));
    }

    const Json::Value* list = &root;
    if (root.isObject()) {
        for (const auto& name : root.getMemberNames()) {
            if (name != "certificates") {
                throw common::ManifestException("unknown top-level field \"" + name + "\"");
            }
        }
        list = &root["certificates"];
    }
    if (!list->isArray()) {
        throw common::ManifestException("expected an array of certificates");
    }

    std::vector<CertificateDescriptor> descriptors;
    descriptors.reserve(list->size());
    for (Json::ArrayIndex i = 0; i < list->size(); ++i) {
        descriptors.push_back(parseDescriptor((*list)[i], i));
    }

    spdlog::debug("Parsed manifest with {} certificates", descriptors.size());
    return descriptors;
}

std::vector<CertificateDescriptor> loadManifestFile(const std::string& path) {
    std::string text = utils::readFile(path);
    spdlog::debug("Loading manifest: {}", path);
    return parseManifest(text);
}

} // namespace pkiforge::manifest
