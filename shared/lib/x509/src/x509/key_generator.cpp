/**
 * @file key_generator.cpp
 * @brief Key pair generation implementation
 */

#include "pkiforge/x509/key_generator.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/string_utils.h"

#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

namespace pkiforge {
namespace x509 {

namespace {
    int curveNidForBits(int bits) {
        switch (bits) {
            case 256: return NID_X9_62_prime256v1;
            case 384: return NID_secp384r1;
            case 521: return NID_secp521r1;
            default:  return NID_undef;
        }
    }

    bool isSupportedRsaSize(int bits) {
        return bits == 1024 || bits == 2048 || bits == 4096;
    }
}

std::optional<KeyType> parseKeyType(const std::string& name) {
    std::string upper = utils::toUpper(utils::trim(name));
    if (upper == "EC" || upper == "ECDSA") {
        return KeyType::EC;
    }
    if (upper == "RSA") {
        return KeyType::RSA;
    }
    if (upper == "ED25519") {
        return KeyType::ED25519;
    }
    return std::nullopt;
}

std::string keyTypeToString(KeyType type) {
    switch (type) {
        case KeyType::EC:      return "EC";
        case KeyType::RSA:     return "RSA";
        case KeyType::ED25519: return "ED25519";
    }
    return "UNKNOWN";
}

int defaultKeySize(KeyType type) {
    return type == KeyType::RSA ? 2048 : 256;
}

void validateKeySpec(const KeySpec& spec) {
    switch (spec.type) {
        case KeyType::EC:
            if (curveNidForBits(spec.bits) == NID_undef) {
                throw common::InvalidKeySpecException(
                    "EC key size " + std::to_string(spec.bits) + " (supported: 256, 384, 521)");
            }
            return;
        case KeyType::RSA:
            if (!isSupportedRsaSize(spec.bits)) {
                throw common::InvalidKeySpecException(
                    "RSA key size " + std::to_string(spec.bits) + " (supported: 1024, 2048, 4096)");
            }
            return;
        case KeyType::ED25519:
            return;
    }
    throw common::InvalidKeySpecException("unknown key type");
}

UniqueKey generateKey(const KeySpec& spec) {
    validateKeySpec(spec);

    if (RAND_status() != 1) {
        throw common::CryptoException("OpenSSL PRNG not seeded");
    }

    int pkeyId = EVP_PKEY_EC;
    if (spec.type == KeyType::RSA) {
        pkeyId = EVP_PKEY_RSA;
    } else if (spec.type == KeyType::ED25519) {
        pkeyId = EVP_PKEY_ED25519;
    }

    UniqueKeyCtx ctx(EVP_PKEY_CTX_new_id(pkeyId, nullptr));
    if (!ctx) {
        throw common::CryptoException("Failed to create " + keyTypeToString(spec.type) +
                                      " key context: " + drainOpenSslErrors());
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw common::CryptoException("Failed to initialize " + keyTypeToString(spec.type) +
                                      " keygen: " + drainOpenSslErrors());
    }

    if (spec.type == KeyType::EC &&
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), curveNidForBits(spec.bits)) <= 0) {
        throw common::CryptoException("Failed to select EC curve: " + drainOpenSslErrors());
    }
    if (spec.type == KeyType::RSA &&
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), spec.bits) <= 0) {
        throw common::CryptoException("Failed to set RSA key size: " + drainOpenSslErrors());
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw common::CryptoException("Failed to generate " + keyTypeToString(spec.type) +
                                      " key pair: " + drainOpenSslErrors());
    }
    return UniqueKey(raw);
}

std::string privateKeyToPem(EVP_PKEY* key) {
    if (!key) {
        throw common::CryptoException("Cannot encode null private key");
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw common::CryptoException("Failed to create BIO");
    }

    if (!PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr)) {
        throw common::CryptoException("Failed to write private key to PEM: " + drainOpenSslErrors());
    }

    return bioToString(bio.get());
}

UniqueKey parsePrivateKeyFromPem(const std::string& pem) {
    if (pem.empty()) {
        return nullptr;
    }

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }

    UniqueKey key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        ERR_clear_error();
    }
    return key;
}

const EVP_MD* signatureDigestFor(EVP_PKEY* key) {
    if (!key) {
        return EVP_sha256();
    }

    int id = EVP_PKEY_get_base_id(key);
    if (id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448) {
        return nullptr;
    }
    if (id == EVP_PKEY_EC) {
        int bits = EVP_PKEY_get_bits(key);
        if (bits > 384) {
            return EVP_sha512();
        }
        if (bits > 256) {
            return EVP_sha384();
        }
    }
    return EVP_sha256();
}

} // namespace x509
} // namespace pkiforge
