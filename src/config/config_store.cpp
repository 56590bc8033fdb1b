#include "config/config_store.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace dbridge::config {

namespace {

const std::vector<std::string> REQUIRED_KEYS = {"host", "port", "username"};
constexpr int64_t MIN_PORT = 1;
constexpr int64_t MAX_PORT = 65535;

std::string trim(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(),
                              [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

//==============================================
// PARSING HELPERS
//==============================================

std::optional<int64_t> parse_int(const std::string& text) {
  std::string trimmed = trim(text);
  const char* first = trimmed.data();
  const char* last = trimmed.data() + trimmed.size();
  if (first != last && *first == '+') {
    ++first;
  }
  if (first == last) {
    return std::nullopt;
  }

  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> parse_bool(const std::string& text) {
  std::string lowered = trim(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "true") {
    return true;
  }
  if (lowered == "false") {
    return false;
  }
  return std::nullopt;
}

bool is_blank(const std::string& text) {
  return trim(text).empty();
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConfigStore::ConfigStore(std::filesystem::path config_path, crypto::CredentialCipher cipher)
  : config_path_(std::move(config_path))
  , cipher_(std::move(cipher)) {
  BOOST_LOG_TRIVIAL(info) << "Config store: Initializing with path: " << config_path_.string();
}


//==============================================
// WRITE OPERATIONS
//==============================================

void ConfigStore::set(const std::string& key, const std::string& value, bool encrypt) {
  check_key(key);
  if (encrypt) {
    entries_.insert_or_assign(key, ConfigValue::from_encrypted(cipher_.encrypt(value)));
    BOOST_LOG_TRIVIAL(debug) << "Config store: Set encrypted value for key: " << key;
  } else {
    entries_.insert_or_assign(key, ConfigValue::from_string(value));
    BOOST_LOG_TRIVIAL(debug) << "Config store: Set value for key: " << key;
  }
}

void ConfigStore::set_int(const std::string& key, int64_t value) {
  check_key(key);
  entries_.insert_or_assign(key, ConfigValue::from_int(value));
  BOOST_LOG_TRIVIAL(debug) << "Config store: Set integer value for key: " << key;
}

void ConfigStore::set_bool(const std::string& key, bool value) {
  check_key(key);
  entries_.insert_or_assign(key, ConfigValue::from_bool(value));
  BOOST_LOG_TRIVIAL(debug) << "Config store: Set boolean value for key: " << key;
}

bool ConfigStore::remove(const std::string& key) {
  bool removed = entries_.erase(key) > 0;
  BOOST_LOG_TRIVIAL(debug) << "Config store: Remove key " << key << (removed ? " done" : " (not present)");
  return removed;
}


//==============================================
// READ OPERATIONS
//==============================================

std::string ConfigStore::get(const std::string& key, const std::string& default_value) const {
  auto text = read_text(key);
  return text ? *text : default_value;
}

std::optional<ConfigValue> ConfigStore::find(const std::string& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string ConfigStore::get_string(const std::string& key, const std::string& default_value) const {
  try {
    return get(key, default_value);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Config store: Using default for key " << key << ": " << e.what();
    return default_value;
  }
}

int64_t ConfigStore::get_int(const std::string& key, int64_t default_value) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return default_value;
  }

  const ConfigValue& value = it->second;
  if (auto number = value.as_int()) {
    return *number;
  }
  if (value.kind() == ConfigValue::Kind::BOOL) {
    return default_value;
  }

  auto parsed = parse_int(get_string(key));
  if (!parsed) {
    BOOST_LOG_TRIVIAL(debug) << "Config store: Value of key " << key << " is not an integer, using default";
    return default_value;
  }
  return *parsed;
}

bool ConfigStore::get_bool(const std::string& key, bool default_value) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return default_value;
  }

  const ConfigValue& value = it->second;
  if (auto flag = value.as_bool()) {
    return *flag;
  }
  if (auto number = value.as_int()) {
    if (*number == 0 || *number == 1) {
      return *number == 1;
    }
    return default_value;
  }

  auto parsed = parse_bool(get_string(key));
  if (!parsed) {
    BOOST_LOG_TRIVIAL(debug) << "Config store: Value of key " << key << " is not a boolean, using default";
    return default_value;
  }
  return *parsed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ConfigStore::contains(const std::string& key) const {
  return entries_.count(key) > 0;
}

bool ConfigStore::is_encrypted(const std::string& key) const {
  auto it = entries_.find(key);
  return it != entries_.end() && it->second.is_encrypted();
}

std::vector<std::string> ConfigStore::keys() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (const auto& [key, value] : entries_) {
    result.push_back(key);
  }
  return result;
}

bool ConfigStore::validate() const {
  for (const auto& key : REQUIRED_KEYS) {
    if (!contains(key) || is_blank(get_string(key))) {
      BOOST_LOG_TRIVIAL(warning) << "Config store: Required key missing or blank: " << key;
      return false;
    }
  }

  auto port = parse_int(get_string("port"));
  if (!port || *port < MIN_PORT || *port > MAX_PORT) {
    BOOST_LOG_TRIVIAL(warning) << "Config store: Port is not an integer in ["
                               << MIN_PORT << ", " << MAX_PORT << "]";
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Config store: Configuration is valid";
  return true;
}


//==============================================
// PERSISTENCE
//==============================================

LoadResult ConfigStore::load() {
  return load(config_path_);
}

LoadResult ConfigStore::load(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Config store: Loading configuration from: " << path.string();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Config store: Cannot inspect " << path.string() << ": " << ec.message();
      throw ConfigLoadError("Cannot inspect " + path.string() + ": " + ec.message());
    }
    BOOST_LOG_TRIVIAL(info) << "Config store: No configuration file at " << path.string();
    return LoadResult::NOT_FOUND;
  }

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config store: Failed to open: " << path.string();
    throw ConfigLoadError("Failed to open " + path.string());
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config store: Malformed JSON in " << path.string() << ": " << e.what();
    throw ConfigLoadError("Malformed JSON in " + path.string() + ": " + e.what());
  }

  if (!document.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Config store: Root of " << path.string() << " is not a JSON object";
    throw ConfigLoadError("Root of " + path.string() + " is not a JSON object");
  }

  // Parse everything before touching entries_ so a bad file leaves the store unchanged
  std::map<std::string, ConfigValue> loaded;
  for (const auto& [key, json_value] : document.items()) {
    if (json_value.is_null()) {
      BOOST_LOG_TRIVIAL(debug) << "Config store: Skipping null value for key: " << key;
      continue;
    }
    auto value = ConfigValue::from_json(json_value);
    if (!value) {
      BOOST_LOG_TRIVIAL(error) << "Config store: Unsupported value shape for key: " << key;
      throw ConfigLoadError("Unsupported value for key '" + key + "'");
    }
    loaded.insert_or_assign(key, std::move(*value));
  }

  for (auto& [key, value] : loaded) {
    entries_.insert_or_assign(key, std::move(value));
  }

  BOOST_LOG_TRIVIAL(info) << "Config store: Loaded " << loaded.size() << " entries";
  return LoadResult::LOADED;
}

void ConfigStore::save() const {
  save(config_path_);
}

void ConfigStore::save(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(info) << "Config store: Saving " << entries_.size() << " entries to: " << path.string();

  nlohmann::json document = nlohmann::json::object();
  for (const auto& [key, value] : entries_) {
    document[key] = value.to_json();
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Config store: Failed to create directory for "
                               << path.string() << ": " << ec.message();
      throw ConfigSaveError("Failed to create directory for " + path.string() + ": " + ec.message());
    }
  }

  // Full overwrite, no temporary file
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config store: Failed to open for writing: " << path.string();
    throw ConfigSaveError("Failed to open " + path.string() + " for writing");
  }

  file << document.dump(2) << '\n';
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config store: Failed to write: " << path.string();
    throw ConfigSaveError("Failed to write " + path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Config store: Configuration saved";
}


//==============================================
// TEARDOWN
//==============================================

void ConfigStore::clear_sensitive_data() {
  BOOST_LOG_TRIVIAL(info) << "Config store: Clearing configuration and key material";
  entries_.clear();
  cipher_.wipe();
}


//==============================================
// UTILITY METHODS
//==============================================

std::optional<std::string> ConfigStore::read_text(const std::string& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (auto blob = it->second.encrypted_blob()) {
    return cipher_.decrypt(*blob);
  }
  return it->second.to_text();
}

void ConfigStore::check_key(const std::string& key) {
  if (is_blank(key)) {
    throw std::invalid_argument("Configuration key cannot be empty");
  }
}

} // namespace dbridge::config
