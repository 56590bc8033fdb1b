#ifndef DBRIDGE_CRYPTO_KEY_STORE_HPP
#define DBRIDGE_CRYPTO_KEY_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <vector>
#include "crypto_error.hpp"

namespace dbridge::crypto {

using SymmetricKey = std::vector<uint8_t>;

class KeyStore {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit KeyStore(std::filesystem::path key_path);


  // ---- KEY OPERATIONS ----
  // Loads the key file, or generates and persists a new key if it is absent.
  // A key file of the wrong size throws KeyCorruptError and is left untouched.
  SymmetricKey ensure_key() const;


  // ---- GETTERS ----
  const std::filesystem::path& key_path() const { return key_path_; }
  // Key file lives next to the configuration file
  static std::filesystem::path path_for_config(const std::filesystem::path& config_path);

private:
  // ---- PARAMETERS ----
  std::filesystem::path key_path_;


  // ---- KEY FILE SUPPORT ----
  SymmetricKey read_key() const;
  SymmetricKey generate_key() const;
  void write_key(const SymmetricKey& key) const;
  // Best effort: failure is logged, not thrown
  void restrict_permissions() const;
};

} // namespace dbridge::crypto

#endif // DBRIDGE_CRYPTO_KEY_STORE_HPP
