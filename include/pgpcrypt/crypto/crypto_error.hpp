#ifndef PGPCRYPT_CRYPTO_ERROR_HPP
#define PGPCRYPT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pgpcrypt::crypto {

// Base of every error raised by the service. what() carries the kind prefix,
// reason() the bare message so callers can wrap it with more context.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message), reason_(message) {}

    const std::string& reason() const noexcept { return reason_; }

protected:
    CryptoError(const std::string& prefix, const std::string& message)
        : std::runtime_error(prefix + message), reason_(message) {}

private:
    std::string reason_;
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: ", message) {}
};

// Neither key source configured, or a required path is missing
class ConfigurationError : public CryptoError {
public:
    explicit ConfigurationError(const std::string& message)
        : CryptoError("Configuration error: ", message) {}
};

class KeyReadError : public CryptoError {
public:
    explicit KeyReadError(const std::string& message)
        : CryptoError("Key read error: ", message) {}
};

class KeyserverError : public CryptoError {
public:
    explicit KeyserverError(const std::string& message)
        : CryptoError("Keyserver error: ", message) {}
};

class PassphraseError : public CryptoError {
public:
    explicit PassphraseError(const std::string& message)
        : CryptoError("Passphrase error: ", message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: ", message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: ", message) {}
};

} // namespace pgpcrypt::crypto

#endif // PGPCRYPT_CRYPTO_ERROR_HPP
