#include "api/api_client.hpp"
#include <boost/log/trivial.hpp>
#include "http/url.hpp"

namespace dbridge {
namespace api {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ApiClient::ApiClient(std::shared_ptr<http::HttpTransport> transport, session::SessionTokenManager& session)
  : transport_(std::move(transport))
  , session_(session) {
  if (!transport_) {
    throw std::invalid_argument("API client requires a transport");
  }
  BOOST_LOG_TRIVIAL(debug) << "API client: Created";
}


//==============================================
// DEVICE QUERIES
//==============================================

std::vector<DeviceInfo> ApiClient::get_devices() {
  nlohmann::json document = send_authenticated(http::Method::GET, "/devices", "", "retrieve devices");
  if (document.is_null()) {
    return {};
  }
  try {
    auto devices = document.get<std::vector<DeviceInfo>>();
    BOOST_LOG_TRIVIAL(info) << "API client: Retrieved " << devices.size() << " devices";
    return devices;
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "API client: Unexpected device list shape: " << e.what();
    throw ApiRequestError("unexpected device list shape", 0);
  }
}

DeviceInfo ApiClient::get_device(const std::string& device_id) {
  nlohmann::json document = send_authenticated(http::Method::GET, device_path(device_id), "",
                                               "retrieve device " + device_id);
  try {
    return document.get<DeviceInfo>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "API client: Unexpected device shape: " << e.what();
    throw ApiRequestError("unexpected device shape for " + device_id, 0);
  }
}

DeviceState ApiClient::get_device_state(const std::string& device_id) {
  nlohmann::json document = send_authenticated(http::Method::GET, device_path(device_id, "/state"), "",
                                               "retrieve device state");
  try {
    return document.get<DeviceState>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "API client: Unexpected device state shape: " << e.what();
    throw ApiRequestError("unexpected device state shape for " + device_id, 0);
  }
}


//==============================================
// DEVICE CONTROL
//==============================================

DeviceState ApiClient::set_device_state(const std::string& device_id, const DeviceStateRequest& request) {
  std::string path = device_path(device_id, "/state");
  nlohmann::json body = request;
  nlohmann::json document = send_authenticated(http::Method::PUT, path, body.dump(), "set device state");
  try {
    return document.get<DeviceState>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "API client: Unexpected device state shape: " << e.what();
    throw ApiRequestError("unexpected device state shape for " + device_id, 0);
  }
}

DeviceState ApiClient::set_device_power(const std::string& device_id, bool turn_on) {
  DeviceStateRequest request;
  request.power = turn_on ? "on" : "off";
  return set_device_state(device_id, request);
}

DeviceState ApiClient::set_device_brightness(const std::string& device_id, int brightness) {
  if (brightness < MIN_BRIGHTNESS || brightness > MAX_BRIGHTNESS) {
    throw std::invalid_argument("Brightness must be between 0 and 100");
  }
  DeviceStateRequest request;
  request.brightness = brightness;
  return set_device_state(device_id, request);
}

DeviceState ApiClient::set_device_color(const std::string& device_id, int color_temperature) {
  if (color_temperature < MIN_COLOR_TEMPERATURE || color_temperature > MAX_COLOR_TEMPERATURE) {
    throw std::invalid_argument("Color temperature must be between 2000 and 6500 Kelvin");
  }
  DeviceStateRequest request;
  request.color_temperature = color_temperature;
  return set_device_state(device_id, request);
}


//==============================================
// REQUEST SUPPORT
//==============================================

nlohmann::json ApiClient::send_authenticated(http::Method method, const std::string& target,
                                             const std::string& body, const std::string& what) {
  // One snapshot: the token sent is the one that was just validated
  session::SessionToken token = session_.require_token();

  http::HttpRequest request;
  request.method = method;
  request.target = target;
  request.headers["Authorization"] = "Bearer " + token.token;
  request.headers["User-Agent"] = http::USER_AGENT;
  request.headers["Accept"] = "application/json";
  if (!body.empty()) {
    request.headers["Content-Type"] = "application/json";
    request.body = body;
  }

  http::HttpResponse response;
  try {
    response = transport_->send(request);
  } catch (const http::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "API client: Failed to " << what << ": " << e.what();
    throw ApiRequestError("failed to " + what + ": " + e.what(), 0);
  }

  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "API client: Failed to " << what << ", status " << response.status;
    throw ApiRequestError("failed to " + what + ", status " + std::to_string(response.status),
                          response.status);
  }

  if (response.body.empty()) {
    return nullptr;
  }

  try {
    return nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "API client: Response to " << what << " is not JSON: " << e.what();
    throw ApiRequestError("response to " + what + " is not valid JSON", response.status);
  }
}

std::string ApiClient::device_path(const std::string& device_id, const std::string& suffix) {
  if (device_id.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw std::invalid_argument("Device ID cannot be empty");
  }
  return "/devices/" + http::Url::escape_segment(device_id) + suffix;
}

} // namespace api
} // namespace dbridge
