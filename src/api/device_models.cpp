#include "api/device_models.hpp"
#include <sstream>

namespace dbridge {
namespace api {

namespace {

template <typename T>
void read_optional(const nlohmann::json& json, const char* name, std::optional<T>& field) {
  auto it = json.find(name);
  if (it == json.end() || it->is_null()) {
    field.reset();
    return;
  }
  field = it->get<T>();
}

template <typename T>
void write_optional(nlohmann::json& json, const char* name, const std::optional<T>& field) {
  if (field) {
    json[name] = *field;
  }
}

std::string read_string(const nlohmann::json& json, const char* name) {
  auto it = json.find(name);
  if (it == json.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

} // namespace

//==============================================
// TEXT SUMMARIES
//==============================================

std::string DeviceState::to_string() const {
  std::ostringstream out;
  out << "Power: " << power.value_or("");
  if (brightness) {
    out << " | Brightness: " << *brightness << "%";
  }
  if (color_temperature) {
    out << " | ColorTemp: " << *color_temperature << "K";
  }
  if (hue) {
    out << " | Hue: " << *hue;
  }
  if (saturation) {
    out << " | Saturation: " << *saturation << "%";
  }
  return out.str();
}

std::string DeviceInfo::to_string() const {
  return "Device: " + name + " (" + id + ") - Type: " + type + " - Status: " + status;
}


//==============================================
// JSON CONVERSION
//==============================================

void to_json(nlohmann::json& json, const DeviceState& state) {
  json = nlohmann::json::object();
  write_optional(json, "power", state.power);
  write_optional(json, "brightness", state.brightness);
  write_optional(json, "color_temperature", state.color_temperature);
  write_optional(json, "hue", state.hue);
  write_optional(json, "saturation", state.saturation);
  write_optional(json, "on_off", state.on_off);
  write_optional(json, "timestamp", state.timestamp);
}

void from_json(const nlohmann::json& json, DeviceState& state) {
  read_optional(json, "power", state.power);
  read_optional(json, "brightness", state.brightness);
  read_optional(json, "color_temperature", state.color_temperature);
  read_optional(json, "hue", state.hue);
  read_optional(json, "saturation", state.saturation);
  read_optional(json, "on_off", state.on_off);
  read_optional(json, "timestamp", state.timestamp);
}

void to_json(nlohmann::json& json, const DeviceInfo& info) {
  json = nlohmann::json{
    {"id", info.id},
    {"name", info.name},
    {"type", info.type},
    {"model", info.model},
    {"location", info.location},
    {"capabilities", info.capabilities},
    {"status", info.status}
  };
  write_optional(json, "state", info.state);
  write_optional(json, "last_updated", info.last_updated);
}

void from_json(const nlohmann::json& json, DeviceInfo& info) {
  info.id = read_string(json, "id");
  info.name = read_string(json, "name");
  info.type = read_string(json, "type");
  info.model = read_string(json, "model");
  info.location = read_string(json, "location");
  info.status = read_string(json, "status");
  read_optional(json, "state", info.state);
  read_optional(json, "last_updated", info.last_updated);

  info.capabilities.clear();
  auto it = json.find("capabilities");
  if (it != json.end() && !it->is_null()) {
    info.capabilities = it->get<std::vector<std::string>>();
  }
}

void to_json(nlohmann::json& json, const DeviceStateRequest& request) {
  json = nlohmann::json::object();
  write_optional(json, "power", request.power);
  write_optional(json, "brightness", request.brightness);
  write_optional(json, "color_temperature", request.color_temperature);
  write_optional(json, "hue", request.hue);
  write_optional(json, "saturation", request.saturation);
}

} // namespace api
} // namespace dbridge
