/**
 * @file key_usage.cpp
 * @brief Key usage name tables
 */

#include "pkiforge/x509/key_usage.h"
#include "pkiforge/utils/string_utils.h"

#include <array>
#include <utility>

namespace pkiforge {
namespace x509 {

namespace {
    struct KeyUsageEntry {
        KeyUsage usage;
        const char* name;
        const char* openSslName;
    };

    struct ExtKeyUsageEntry {
        ExtKeyUsage usage;
        const char* name;
        const char* openSslName;
    };

    const std::array<KeyUsageEntry, 9> kKeyUsages = {{
        {KeyUsage::DigitalSignature,  "DigitalSignature",  "digitalSignature"},
        {KeyUsage::ContentCommitment, "ContentCommitment", "nonRepudiation"},
        {KeyUsage::KeyEncipherment,   "KeyEncipherment",   "keyEncipherment"},
        {KeyUsage::DataEncipherment,  "DataEncipherment",  "dataEncipherment"},
        {KeyUsage::KeyAgreement,      "KeyAgreement",      "keyAgreement"},
        {KeyUsage::CertSign,          "CertSign",          "keyCertSign"},
        {KeyUsage::CRLSign,           "CRLSign",           "cRLSign"},
        {KeyUsage::EncipherOnly,      "EncipherOnly",      "encipherOnly"},
        {KeyUsage::DecipherOnly,      "DecipherOnly",      "decipherOnly"},
    }};

    const std::array<ExtKeyUsageEntry, 14> kExtKeyUsages = {{
        {ExtKeyUsage::Any,                            "Any",                            "anyExtendedKeyUsage"},
        {ExtKeyUsage::ServerAuth,                     "ServerAuth",                     "serverAuth"},
        {ExtKeyUsage::ClientAuth,                     "ClientAuth",                     "clientAuth"},
        {ExtKeyUsage::CodeSigning,                    "CodeSigning",                    "codeSigning"},
        {ExtKeyUsage::EmailProtection,                "EmailProtection",                "emailProtection"},
        {ExtKeyUsage::IPSECEndSystem,                 "IPSECEndSystem",                 "ipsecEndSystem"},
        {ExtKeyUsage::IPSECTunnel,                    "IPSECTunnel",                    "ipsecTunnel"},
        {ExtKeyUsage::IPSECUser,                      "IPSECUser",                      "ipsecUser"},
        {ExtKeyUsage::TimeStamping,                   "TimeStamping",                   "timeStamping"},
        {ExtKeyUsage::OCSPSigning,                    "OCSPSigning",                    "OCSPSigning"},
        {ExtKeyUsage::MicrosoftServerGatedCrypto,     "MicrosoftServerGatedCrypto",     "msSGC"},
        {ExtKeyUsage::NetscapeServerGatedCrypto,      "NetscapeServerGatedCrypto",      "nsSGC"},
        {ExtKeyUsage::MicrosoftCommercialCodeSigning, "MicrosoftCommercialCodeSigning", "msCodeCom"},
        {ExtKeyUsage::MicrosoftKernelCodeSigning,     "MicrosoftKernelCodeSigning",     "1.3.6.1.4.1.311.61.1.1"},
    }};
}

std::optional<KeyUsage> parseKeyUsage(const std::string& name) {
    std::string lower = utils::toLower(utils::trim(name));
    for (const auto& entry : kKeyUsages) {
        if (utils::toLower(entry.name) == lower) {
            return entry.usage;
        }
    }
    return std::nullopt;
}

std::string keyUsageName(KeyUsage usage) {
    for (const auto& entry : kKeyUsages) {
        if (entry.usage == usage) {
            return entry.name;
        }
    }
    return "Unknown";
}

std::string keyUsageOpenSslName(KeyUsage usage) {
    for (const auto& entry : kKeyUsages) {
        if (entry.usage == usage) {
            return entry.openSslName;
        }
    }
    return "";
}

std::optional<ExtKeyUsage> parseExtKeyUsage(const std::string& name) {
    std::string lower = utils::toLower(utils::trim(name));
    for (const auto& entry : kExtKeyUsages) {
        if (utils::toLower(entry.name) == lower) {
            return entry.usage;
        }
    }
    return std::nullopt;
}

std::string extKeyUsageName(ExtKeyUsage usage) {
    for (const auto& entry : kExtKeyUsages) {
        if (entry.usage == usage) {
            return entry.name;
        }
    }
    return "Unknown";
}

std::string extKeyUsageOpenSslName(ExtKeyUsage usage) {
    for (const auto& entry : kExtKeyUsages) {
        if (entry.usage == usage) {
            return entry.openSslName;
        }
    }
    return "";
}

std::vector<KeyUsage> defaultKeyUsages(bool isCa) {
    if (isCa) {
        return {KeyUsage::CertSign, KeyUsage::CRLSign};
    }
    return {KeyUsage::KeyEncipherment, KeyUsage::DigitalSignature};
}

} // namespace x509
} // namespace pkiforge
