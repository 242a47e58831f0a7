/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Every failure on the generation path aborts the run with one of these.
 * Each exception carries a stable error code for the command-line front end.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pkiforge::common {

/**
 * @brief Base exception for all pkiforge errors
 */
class PkiforgeException : public std::runtime_error {
private:
    std::string code_;

public:
    PkiforgeException(std::string code, const std::string& message)
        : std::runtime_error(message),
          code_(std::move(code)) {}

    /**
     * @brief Get the error code (e.g., "UNRESOLVED_ISSUER")
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }
};

/**
 * @brief Malformed manifest, unknown field, invalid field value
 */
class ManifestException : public PkiforgeException {
public:
    explicit ManifestException(const std::string& message)
        : PkiforgeException("MANIFEST_ERROR", "Manifest error: " + message) {}
};

/**
 * @brief Issuer reference does not name an earlier manifest entry
 */
class UnresolvedIssuerException : public PkiforgeException {
public:
    UnresolvedIssuerException(const std::string& subject, const std::string& issuer)
        : PkiforgeException("UNRESOLVED_ISSUER",
              "Unresolved issuer: \"" + issuer + "\" referenced by \"" + subject +
              "\" is not declared earlier in the manifest") {}
};

/**
 * @brief Unsupported key algorithm / size combination
 */
class InvalidKeySpecException : public PkiforgeException {
public:
    explicit InvalidKeySpecException(const std::string& message)
        : PkiforgeException("INVALID_KEY_SPEC", "Invalid key spec: " + message) {}
};

/**
 * @brief Unparseable subject alternative name
 */
class InvalidSanException : public PkiforgeException {
public:
    explicit InvalidSanException(const std::string& message)
        : PkiforgeException("INVALID_SAN", "Invalid subject alternative name: " + message) {}
};

/**
 * @brief File system operation failed
 */
class FilesystemException : public PkiforgeException {
public:
    explicit FilesystemException(const std::string& message)
        : PkiforgeException("FILESYSTEM_ERROR", "Filesystem error: " + message) {}
};

/**
 * @brief OpenSSL key generation, signing or encoding failed
 */
class CryptoException : public PkiforgeException {
public:
    explicit CryptoException(const std::string& message)
        : PkiforgeException("CRYPTO_ERROR", "Crypto error: " + message) {}
};

/**
 * @brief Revocation requested for an entity without an issuing authority
 */
class RevocationException : public PkiforgeException {
public:
    explicit RevocationException(const std::string& message)
        : PkiforgeException("REVOCATION_ERROR", "Revocation error: " + message) {}
};

} // namespace pkiforge::common
