#ifndef DBRIDGE_CRYPTO_CREDENTIAL_CIPHER_HPP
#define DBRIDGE_CRYPTO_CREDENTIAL_CIPHER_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"
#include "key_store.hpp"

namespace dbridge::crypto {

// Encrypts single string values for storage at rest.
//
// Blob layout: base64(IV || AES-256-CBC ciphertext), PKCS7 padded. There is
// no authentication tag, so a modified blob can decrypt to wrong plaintext
// without DecryptionError being raised.
class CredentialCipher {
public:
  static constexpr size_t KEY_SIZE = KeyStore::KEY_SIZE;
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CredentialCipher(SymmetricKey key);
  ~CredentialCipher();

  CredentialCipher(const CredentialCipher&) = delete;
  CredentialCipher& operator=(const CredentialCipher&) = delete;
  CredentialCipher(CredentialCipher&& other) noexcept;
  CredentialCipher& operator=(CredentialCipher&& other) noexcept;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Empty plaintext is returned unchanged
  std::string encrypt(const std::string& plaintext) const;
  // Empty blob is returned unchanged
  std::string decrypt(const std::string& blob) const;


  // ---- KEY LIFECYCLE ----
  // Overwrites the key in memory; the cipher is unusable afterwards
  void wipe();
  bool is_usable() const { return key_.size() == KEY_SIZE; }

  // Generate an initialization vector
  static std::array<uint8_t, IV_SIZE> generate_iv();

private:
  // ---- PARAMETERS ----
  SymmetricKey key_;


  // ---- CIPHER SUPPORT ----
  void check_usable() const;
  std::vector<uint8_t> run_cipher(const uint8_t* input, size_t length,
                                  const uint8_t* iv, bool encrypting) const;


  // ---- BASE64 SUPPORT ----
  static std::string to_base64(const std::vector<uint8_t>& data);
  static std::vector<uint8_t> from_base64(const std::string& text);
};

} // namespace dbridge::crypto

#endif // DBRIDGE_CRYPTO_CREDENTIAL_CIPHER_HPP
