/**
 * @file subject_alt_name.cpp
 * @brief Typed Subject Alternative Name parsing
 */

#include "pkiforge/x509/subject_alt_name.h"
#include "pkiforge/x509/openssl_ptr.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/string_utils.h"

#include <cctype>
#include <regex>

namespace pkiforge {
namespace x509 {

namespace {
    const std::regex kUriPattern(R"(^([A-Za-z][A-Za-z0-9+.\-]*):[^\s]+$)");

    bool hasValidPercentEncoding(const std::string& value) {
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] != '%') {
                continue;
            }
            if (i + 2 >= value.size() ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                return false;
            }
        }
        return true;
    }

    IpAddress parseIp(const std::string& value) {
        ASN1_OCTET_STRING* octets = a2i_IPADDRESS(value.c_str());
        if (!octets) {
            ERR_clear_error();
            throw common::InvalidSanException("invalid IP address \"" + value + "\"");
        }

        IpAddress ip;
        ip.text = value;
        const unsigned char* data = ASN1_STRING_get0_data(octets);
        ip.octets.assign(data, data + ASN1_STRING_length(octets));
        ASN1_OCTET_STRING_free(octets);
        return ip;
    }

    UriName parseUri(const std::string& value) {
        std::smatch match;
        if (!std::regex_match(value, match, kUriPattern) || !hasValidPercentEncoding(value)) {
            throw common::InvalidSanException("invalid URI \"" + value + "\"");
        }
        return UriName{value, utils::toLower(match[1].str())};
    }

    GENERAL_NAME* makeIa5Name(int type, const std::string& value) {
        UniqueGeneralName name(GENERAL_NAME_new());
        ASN1_IA5STRING* ia5 = ASN1_IA5STRING_new();
        if (!name || !ia5) {
            ASN1_IA5STRING_free(ia5);
            return nullptr;
        }
        if (!ASN1_STRING_set(ia5, value.data(), static_cast<int>(value.size()))) {
            ASN1_IA5STRING_free(ia5);
            return nullptr;
        }
        GENERAL_NAME_set0_value(name.get(), type, ia5);
        return name.release();
    }

    GENERAL_NAME* makeIpName(const IpAddress& ip) {
        UniqueGeneralName name(GENERAL_NAME_new());
        ASN1_OCTET_STRING* octets = ASN1_OCTET_STRING_new();
        if (!name || !octets) {
            ASN1_OCTET_STRING_free(octets);
            return nullptr;
        }
        if (!ASN1_OCTET_STRING_set(octets, ip.octets.data(), static_cast<int>(ip.octets.size()))) {
            ASN1_OCTET_STRING_free(octets);
            return nullptr;
        }
        GENERAL_NAME_set0_value(name.get(), GEN_IPADD, octets);
        return name.release();
    }
}

SubjectAltName parseSubjectAltName(const std::string& entry) {
    size_t colon = entry.find(':');
    if (colon == std::string::npos) {
        throw common::InvalidSanException("missing type prefix in \"" + entry +
                                          "\" (expected DNS:, IP: or URI:)");
    }

    std::string prefix = utils::toUpper(utils::trim(entry.substr(0, colon)));
    std::string value = utils::trim(entry.substr(colon + 1));
    if (value.empty()) {
        throw common::InvalidSanException("empty value in \"" + entry + "\"");
    }

    if (prefix == "DNS") {
        return DnsName{value};
    } else if (prefix == "IP") {
        return parseIp(value);
    } else if (prefix == "URI") {
        return parseUri(value);
    }

    throw common::InvalidSanException("unknown type prefix \"" + prefix + "\" in \"" + entry + "\"");
}

std::string subjectAltNameToString(const SubjectAltName& san) {
    if (auto dns = std::get_if<DnsName>(&san)) {
        return "DNS:" + dns->value;
    }
    if (auto ip = std::get_if<IpAddress>(&san)) {
        return "IP:" + ip->text;
    }
    return "URI:" + std::get<UriName>(san).value;
}

GENERAL_NAMES* toGeneralNames(const std::vector<SubjectAltName>& sans) {
    UniqueGeneralNames names(sk_GENERAL_NAME_new_null());
    if (!names) {
        return nullptr;
    }

    for (const auto& san : sans) {
        GENERAL_NAME* name = nullptr;
        if (auto dns = std::get_if<DnsName>(&san)) {
            name = makeIa5Name(GEN_DNS, dns->value);
        } else if (auto ip = std::get_if<IpAddress>(&san)) {
            name = makeIpName(*ip);
        } else {
            name = makeIa5Name(GEN_URI, std::get<UriName>(san).value);
        }

        if (!name || !sk_GENERAL_NAME_push(names.get(), name)) {
            GENERAL_NAME_free(name);
            return nullptr;
        }
    }

    return names.release();
}

} // namespace x509
} // namespace pkiforge
