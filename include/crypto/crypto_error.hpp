#ifndef DBRIDGE_CRYPTO_ERROR_HPP
#define DBRIDGE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dbridge::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Cipher constructed with a bad key, or used after wipe()
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Malformed base64, truncated blob or padding check failure
class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

// Key file could not be read or written
class KeyStoreError : public CryptoError {
public:
    explicit KeyStoreError(const std::string& message)
        : CryptoError("Key store error: " + message) {}
};

// Key file exists but does not hold exactly KEY_SIZE bytes
class KeyCorruptError : public KeyStoreError {
public:
    explicit KeyCorruptError(const std::string& message)
        : KeyStoreError("Corrupt key: " + message) {}
};

} // namespace dbridge::crypto

#endif // DBRIDGE_CRYPTO_ERROR_HPP
