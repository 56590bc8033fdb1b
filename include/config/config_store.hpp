#ifndef DBRIDGE_CONFIG_STORE_HPP
#define DBRIDGE_CONFIG_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "config/config_error.hpp"
#include "config/config_value.hpp"
#include "crypto/credential_cipher.hpp"

namespace dbridge::config {

// Key/value configuration persisted as one flat JSON object.
//
// Not thread safe: load() and save() do synchronous, unlocked file I/O and
// must not run concurrently against the same instance.
class ConfigStore {
public:
  static constexpr const char* DEFAULT_CONFIG_PATH = "./config/leviton.json";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConfigStore(std::filesystem::path config_path, crypto::CredentialCipher cipher);


  // ---- WRITE OPERATIONS ----
  // Stores a string value, encrypted with the credential cipher when encrypt is set
  void set(const std::string& key, const std::string& value, bool encrypt = false);
  void set_int(const std::string& key, int64_t value);
  void set_bool(const std::string& key, bool value);
  // Returns false when the key was not present
  bool remove(const std::string& key);


  // ---- READ OPERATIONS ----
  // Text form of the value, decrypted if needed. Throws DecryptionError for
  // an encrypted value that cannot be decrypted.
  std::string get(const std::string& key, const std::string& default_value = "") const;
  // Raw stored value, still encrypted
  std::optional<ConfigValue> find(const std::string& key) const;

  // Typed getters: fall back to default_value on absence, parse failure or
  // decryption failure. They never throw.
  std::string get_string(const std::string& key, const std::string& default_value = "") const;
  int64_t get_int(const std::string& key, int64_t default_value = 0) const;
  // INT entries 0 and 1 read as false and true; other integers yield the default
  bool get_bool(const std::string& key, bool default_value = false) const;


  // ---- QUERY OPERATIONS ----
  bool contains(const std::string& key) const;
  bool is_encrypted(const std::string& key) const;
  std::vector<std::string> keys() const;
  size_t size() const { return entries_.size(); }
  const std::filesystem::path& config_path() const { return config_path_; }

  // Checks host, port and username are present and non-blank and that port
  // is an integer in [1, 65535]
  bool validate() const;


  // ---- PERSISTENCE ----
  LoadResult load();
  LoadResult load(const std::filesystem::path& path);
  void save() const;
  void save(const std::filesystem::path& path) const;


  // ---- TEARDOWN ----
  // Drops every entry and wipes the cipher key from memory
  void clear_sensitive_data();

private:
  // ---- PARAMETERS ----
  std::filesystem::path config_path_;
  crypto::CredentialCipher cipher_;
  std::map<std::string, ConfigValue> entries_;


  // ---- UTILITY METHODS ----
  // Text form with decryption; nullopt when absent
  std::optional<std::string> read_text(const std::string& key) const;
  static void check_key(const std::string& key);
};

// Best-effort parsers shared with the typed getters
std::optional<int64_t> parse_int(const std::string& text);
std::optional<bool> parse_bool(const std::string& text);
bool is_blank(const std::string& text);

} // namespace dbridge::config

#endif // DBRIDGE_CONFIG_STORE_HPP
