/**
 * @file key_generator.h
 * @brief Key pair generation and private key encoding
 */

#pragma once

#include <string>
#include <optional>
#include <openssl/evp.h>
#include "pkiforge/x509/openssl_ptr.h"

namespace pkiforge {
namespace x509 {

/**
 * @brief Key algorithm
 */
enum class KeyType {
    EC,         ///< ECDSA over NIST P-256 / P-384 / P-521
    RSA,        ///< RSA 1024 / 2048 / 4096
    ED25519     ///< Ed25519 (size is fixed)
};

/**
 * @brief Key algorithm plus size in bits
 */
struct KeySpec {
    KeyType type = KeyType::EC;
    int bits = 256;
};

/**
 * @brief Parse key type name ("EC", "RSA", "ED25519"), case-insensitive
 */
std::optional<KeyType> parseKeyType(const std::string& name);

/**
 * @brief Convert KeyType to its canonical name
 */
std::string keyTypeToString(KeyType type);

/**
 * @brief Default size for a key type (256 for EC, 2048 for RSA, 256 for Ed25519)
 */
int defaultKeySize(KeyType type);

/**
 * @brief Check that the algorithm/size combination is supported
 * @throws common::InvalidKeySpecException
 */
void validateKeySpec(const KeySpec& spec);

/**
 * @brief Generate a fresh key pair
 *
 * @throws common::InvalidKeySpecException for unsupported combinations
 * @throws common::CryptoException if OpenSSL key generation fails
 */
UniqueKey generateKey(const KeySpec& spec);

/**
 * @brief Encode private key as PKCS#8 PEM ("BEGIN PRIVATE KEY")
 * @throws common::CryptoException on encoding failure
 */
std::string privateKeyToPem(EVP_PKEY* key);

/**
 * @brief Parse a PEM private key
 * @return Key, or nullptr if the PEM cannot be parsed
 */
UniqueKey parsePrivateKeyFromPem(const std::string& pem);

/**
 * @brief Digest used when signing with this key
 *
 * SHA-256 for RSA and P-256, SHA-384 for P-384, SHA-512 for P-521,
 * nullptr for Ed25519 (pure signature scheme).
 */
const EVP_MD* signatureDigestFor(EVP_PKEY* key);

} // namespace x509
} // namespace pkiforge
