#ifndef DBRIDGE_CONFIG_BRIDGE_SETTINGS_HPP
#define DBRIDGE_CONFIG_BRIDGE_SETTINGS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "config/config_store.hpp"

namespace dbridge::config {

// Typed snapshot of the well-known configuration keys
struct BridgeSettings {
  static constexpr uint16_t DEFAULT_PORT = 8080;
  static constexpr int64_t DEFAULT_CONNECTION_TIMEOUT_MS = 5000;
  static constexpr const char* DEFAULT_API_BASE_URL = "https://api.leviton.com/api";

  std::string host;
  uint16_t port{DEFAULT_PORT};
  std::string username;
  std::string password;
  std::string api_key;
  std::chrono::milliseconds connection_timeout{DEFAULT_CONNECTION_TIMEOUT_MS};
  bool use_ssl{false};
  std::string api_base_url{DEFAULT_API_BASE_URL};

  // Never throws; unreadable or undecryptable entries fall back to defaults
  static BridgeSettings from_config(const ConfigStore& store);

  bool has_credentials() const { return !username.empty() && !password.empty(); }
};

} // namespace dbridge::config

#endif // DBRIDGE_CONFIG_BRIDGE_SETTINGS_HPP
