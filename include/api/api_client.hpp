#ifndef DBRIDGE_API_CLIENT_HPP
#define DBRIDGE_API_CLIENT_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "api/device_models.hpp"
#include "http/http_transport.hpp"
#include "session/session_token_manager.hpp"

namespace dbridge {
namespace api {

// Device call failed: non-success status (status() holds it), transport
// failure (status() is 0) or an unreadable response body
class ApiRequestError : public std::runtime_error {
public:
  ApiRequestError(const std::string& message, unsigned status)
    : std::runtime_error("API request error: " + message), status_(status) {}

  unsigned status() const { return status_; }

private:
  unsigned status_;
};

class ApiClient {
public:
  static constexpr int MIN_BRIGHTNESS = 0;
  static constexpr int MAX_BRIGHTNESS = 100;
  static constexpr int MIN_COLOR_TEMPERATURE = 2000;   // Kelvin
  static constexpr int MAX_COLOR_TEMPERATURE = 6500;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ApiClient(std::shared_ptr<http::HttpTransport> transport, session::SessionTokenManager& session);


  // ---- DEVICE QUERIES ----
  std::vector<DeviceInfo> get_devices();
  DeviceInfo get_device(const std::string& device_id);
  DeviceState get_device_state(const std::string& device_id);


  // ---- DEVICE CONTROL ----
  DeviceState set_device_state(const std::string& device_id, const DeviceStateRequest& request);
  DeviceState set_device_power(const std::string& device_id, bool turn_on);
  // brightness in [0, 100]
  DeviceState set_device_brightness(const std::string& device_id, int brightness);
  // color_temperature in [2000, 6500] Kelvin
  DeviceState set_device_color(const std::string& device_id, int color_temperature);

private:
  // ---- PARAMETERS ----
  std::shared_ptr<http::HttpTransport> transport_;
  session::SessionTokenManager& session_;


  // ---- REQUEST SUPPORT ----
  // Validates the session, attaches the bearer token and sends the request
  nlohmann::json send_authenticated(http::Method method, const std::string& target,
                                    const std::string& body, const std::string& what);
  static std::string device_path(const std::string& device_id, const std::string& suffix = "");
};

} // namespace api
} // namespace dbridge

#endif // DBRIDGE_API_CLIENT_HPP
