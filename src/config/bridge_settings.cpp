#include "config/bridge_settings.hpp"
#include <boost/log/trivial.hpp>

namespace dbridge::config {

BridgeSettings BridgeSettings::from_config(const ConfigStore& store) {
  BridgeSettings settings;
  settings.host = store.get_string("host");
  settings.username = store.get_string("username");
  settings.password = store.get_string("password");
  settings.api_key = store.get_string("api_key");
  settings.use_ssl = store.get_bool("use_ssl", false);

  int64_t port = store.get_int("port", DEFAULT_PORT);
  if (port < 1 || port > 65535) {
    BOOST_LOG_TRIVIAL(warning) << "Bridge settings: Port " << port << " out of range, using " << DEFAULT_PORT;
    port = DEFAULT_PORT;
  }
  settings.port = static_cast<uint16_t>(port);

  int64_t timeout = store.get_int("connection_timeout", DEFAULT_CONNECTION_TIMEOUT_MS);
  if (timeout <= 0) {
    BOOST_LOG_TRIVIAL(warning) << "Bridge settings: Non-positive connection timeout, using "
                               << DEFAULT_CONNECTION_TIMEOUT_MS << " ms";
    timeout = DEFAULT_CONNECTION_TIMEOUT_MS;
  }
  settings.connection_timeout = std::chrono::milliseconds(timeout);

  // An explicit base URL wins; otherwise the endpoint is built from host and port
  settings.api_base_url = store.get_string("api_base_url");
  if (settings.api_base_url.empty() && !settings.host.empty()) {
    settings.api_base_url = std::string(settings.use_ssl ? "https" : "http") + "://" +
                            settings.host + ":" + std::to_string(settings.port) + "/api";
  }
  if (settings.api_base_url.empty()) {
    settings.api_base_url = DEFAULT_API_BASE_URL;
  }

  return settings;
}

} // namespace dbridge::config
