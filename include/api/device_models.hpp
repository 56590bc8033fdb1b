#ifndef DBRIDGE_API_DEVICE_MODELS_HPP
#define DBRIDGE_API_DEVICE_MODELS_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dbridge {
namespace api {

// Field names follow the cloud API exactly and are case-sensitive.
// Timestamps are kept as the ISO-8601 text the API sends.

struct DeviceState {
  std::optional<std::string> power;
  std::optional<int> brightness;
  std::optional<int> color_temperature;
  std::optional<int> hue;
  std::optional<int> saturation;
  std::optional<bool> on_off;
  std::optional<std::string> timestamp;

  // e.g. "Power: on | Brightness: 50%"
  std::string to_string() const;
};

struct DeviceInfo {
  std::string id;
  std::string name;
  std::string type;
  std::string model;
  std::string location;
  std::optional<DeviceState> state;
  std::vector<std::string> capabilities;
  std::string status;
  std::optional<std::string> last_updated;

  std::string to_string() const;
};

// Body of a state change; only the fields that are set are sent
struct DeviceStateRequest {
  std::optional<std::string> power;
  std::optional<int> brightness;
  std::optional<int> color_temperature;
  std::optional<int> hue;
  std::optional<int> saturation;
};

// ---- JSON CONVERSION ----
// Absent or null fields are left empty on read and omitted on write
void to_json(nlohmann::json& json, const DeviceState& state);
void from_json(const nlohmann::json& json, DeviceState& state);
void to_json(nlohmann::json& json, const DeviceInfo& info);
void from_json(const nlohmann::json& json, DeviceInfo& info);
void to_json(nlohmann::json& json, const DeviceStateRequest& request);

} // namespace api
} // namespace dbridge

#endif // DBRIDGE_API_DEVICE_MODELS_HPP
