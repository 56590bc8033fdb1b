#include "crypto/key_store.hpp"
#include <fstream>
#include <iterator>
#include <system_error>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace dbridge::crypto {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

KeyStore::KeyStore(std::filesystem::path key_path) : key_path_(std::move(key_path)) {
  BOOST_LOG_TRIVIAL(debug) << "KeyStore: Using key file: " << key_path_.string();
}

std::filesystem::path KeyStore::path_for_config(const std::filesystem::path& config_path) {
  return config_path.parent_path() / ".key";
}


//==============================================
// KEY OPERATIONS
//==============================================

SymmetricKey KeyStore::ensure_key() const {
  std::error_code ec;
  bool exists = std::filesystem::exists(key_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: Cannot inspect key file " << key_path_.string() << ": " << ec.message();
    throw KeyStoreError("Cannot inspect key file: " + key_path_.string());
  }

  if (exists) {
    BOOST_LOG_TRIVIAL(debug) << "KeyStore: Loading existing key";
    return read_key();
  }

  BOOST_LOG_TRIVIAL(info) << "KeyStore: No key file found, generating a new key";
  SymmetricKey key = generate_key();
  write_key(key);
  restrict_permissions();
  BOOST_LOG_TRIVIAL(info) << "KeyStore: New key written to " << key_path_.string();
  return key;
}


//==============================================
// KEY FILE SUPPORT
//==============================================

SymmetricKey KeyStore::read_key() const {
  if (!std::filesystem::is_regular_file(key_path_)) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: Key path is not a regular file: " << key_path_.string();
    throw KeyStoreError("Key path is not a regular file: " + key_path_.string());
  }

  std::ifstream file(key_path_, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: Failed to open key file: " << key_path_.string();
    throw KeyStoreError("Failed to open key file: " + key_path_.string());
  }

  SymmetricKey key((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw KeyStoreError("Failed to read key file: " + key_path_.string());
  }

  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: Key file holds " << key.size()
                             << " bytes (expected " << KEY_SIZE << ")";
    OPENSSL_cleanse(key.data(), key.size());
    throw KeyCorruptError("Key file holds " + std::to_string(key.size()) +
                          " bytes, expected " + std::to_string(KEY_SIZE));
  }
  return key;
}

SymmetricKey KeyStore::generate_key() const {
  SymmetricKey key(KEY_SIZE);
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: CSPRNG failed to produce key material";
    throw KeyStoreError("Failed to generate random key");
  }
  return key;
}

void KeyStore::write_key(const SymmetricKey& key) const {
  std::error_code ec;
  if (key_path_.has_parent_path()) {
    std::filesystem::create_directories(key_path_.parent_path(), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "KeyStore: Failed to create key directory: " << ec.message();
      throw KeyStoreError("Failed to create directory for key file: " + key_path_.string());
    }
  }

  std::ofstream file(key_path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: Failed to create key file: " << key_path_.string();
    throw KeyStoreError("Failed to create key file: " + key_path_.string());
  }

  file.write(reinterpret_cast<const char*>(key.data()), static_cast<std::streamsize>(key.size()));
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "KeyStore: Failed to write key file: " << key_path_.string();
    throw KeyStoreError("Failed to write key file: " + key_path_.string());
  }
}

void KeyStore::restrict_permissions() const {
  std::error_code ec;
  std::filesystem::permissions(key_path_,
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "KeyStore: Could not restrict key file permissions: " << ec.message();
  }
}

} // namespace dbridge::crypto
