/**
 * @file dn_parser.cpp
 * @brief DN Parser implementation
 */

#include "pkiforge/x509/dn_parser.h"
#include "pkiforge/x509/openssl_ptr.h"
#include "pkiforge/utils/string_utils.h"

#include <openssl/objects.h>
#include <sstream>
#include <vector>
#include <utility>

namespace pkiforge {
namespace x509 {

namespace {

    /**
     * @brief Resolve an attribute name to its NID, ignoring case
     */
    int attributeNid(const std::string& attr) {
        int nid = OBJ_txt2nid(attr.c_str());
        if (nid != NID_undef) {
            return nid;
        }

        nid = OBJ_txt2nid(utils::toUpper(attr).c_str());
        if (nid != NID_undef) {
            return nid;
        }

        std::string lower = utils::toLower(attr);
        if (lower == "email" || lower == "emailaddress") {
            return NID_pkcs9_emailAddress;
        }
        if (lower == "commonname") {
            return NID_commonName;
        }
        if (lower == "serialnumber") {
            return NID_serialNumber;
        }
        return NID_undef;
    }

    bool addEntry(X509_NAME* name, std::string attr, std::string value) {
        attr = utils::trim(attr);
        value = utils::trim(value);
        if (attr.empty() || value.empty()) {
            return false;
        }

        int nid = attributeNid(attr);
        if (nid == NID_undef) {
            return false;
        }

        return X509_NAME_add_entry_by_NID(name, nid, MBSTRING_UTF8,
                                          reinterpret_cast<const unsigned char*>(value.c_str()),
                                          static_cast<int>(value.length()), -1, 0) == 1;
    }

    /**
     * @brief Split RFC2253 text into attribute/value pairs, honoring '\' escapes
     */
    std::optional<std::vector<std::pair<std::string, std::string>>> splitRfc2253(const std::string& dn) {
        std::vector<std::pair<std::string, std::string>> result;
        std::string attr, value;
        bool inAttr = true;
        bool escaped = false;

        for (char c : dn) {
            if (escaped) {
                (inAttr ? attr : value) += c;
                escaped = false;
                continue;
            }
            if (c == '\\') {
                escaped = true;
                continue;
            }
            if (c == '=' && inAttr) {
                inAttr = false;
                continue;
            }
            if ((c == ',' || c == '+') && !inAttr) {
                result.emplace_back(attr, value);
                attr.clear();
                value.clear();
                inAttr = true;
                continue;
            }
            if (c == ',' && inAttr) {
                return std::nullopt;
            }
            (inAttr ? attr : value) += c;
        }

        if (escaped || inAttr) {
            return std::nullopt;
        }
        result.emplace_back(attr, value);
        return result;
    }
}

X509_NAME* parseDnString(const std::string& dn) {
    std::string text = utils::trim(dn);
    if (text.empty()) {
        return nullptr;
    }

    UniqueName name(X509_NAME_new());
    if (!name) {
        return nullptr;
    }

    if (text[0] == '/') {
        // OpenSSL oneline format: /C=XX/O=Org/CN=Name
        std::istringstream iss(text.substr(1));
        std::string component;

        while (std::getline(iss, component, '/')) {
            size_t eqPos = component.find('=');
            if (eqPos == std::string::npos) {
                return nullptr;
            }
            if (!addEntry(name.get(), component.substr(0, eqPos), component.substr(eqPos + 1))) {
                return nullptr;
            }
        }
    } else {
        auto pairs = splitRfc2253(text);
        if (!pairs) {
            return nullptr;
        }
        for (const auto& [attr, value] : *pairs) {
            if (!addEntry(name.get(), attr, value)) {
                return nullptr;
            }
        }
    }

    if (X509_NAME_entry_count(name.get()) == 0) {
        return nullptr;
    }

    return name.release();
}

std::optional<std::string> getCommonName(const X509_NAME* name) {
    if (!name) {
        return std::nullopt;
    }

    int index = -1;
    int last = -1;
    while ((index = X509_NAME_get_index_by_NID(name, NID_commonName, index)) >= 0) {
        last = index;
    }
    if (last < 0) {
        return std::nullopt;
    }

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, last);
    ASN1_STRING* data = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
    if (!data) {
        return std::nullopt;
    }

    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0 || !utf8) {
        return std::nullopt;
    }

    std::string value(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return value;
}

} // namespace x509
} // namespace pkiforge
