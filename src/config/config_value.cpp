#include "config/config_value.hpp"
#include <limits>

namespace dbridge::config {

namespace {

constexpr const char* ENCRYPTED_FLAG = "isEncrypted";
constexpr const char* ENCRYPTED_VALUE = "value";

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

//==============================================
// FACTORIES
//==============================================

ConfigValue ConfigValue::from_string(std::string value) {
  return ConfigValue(Storage(std::in_place_type<std::string>, std::move(value)));
}

ConfigValue ConfigValue::from_int(int64_t value) {
  return ConfigValue(Storage(std::in_place_type<int64_t>, value));
}

ConfigValue ConfigValue::from_bool(bool value) {
  return ConfigValue(Storage(std::in_place_type<bool>, value));
}

ConfigValue ConfigValue::from_encrypted(std::string blob) {
  return ConfigValue(Storage(std::in_place_type<Encrypted>, Encrypted{std::move(blob)}));
}


//==============================================
// QUERIES
//==============================================

ConfigValue::Kind ConfigValue::kind() const {
  return std::visit(overloaded{
      [](const std::string&) { return Kind::STRING; },
      [](int64_t) { return Kind::INT; },
      [](bool) { return Kind::BOOL; },
      [](const Encrypted&) { return Kind::ENCRYPTED_STRING; }
  }, value_);
}

std::optional<std::string> ConfigValue::as_string() const {
  if (auto value = std::get_if<std::string>(&value_)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<int64_t> ConfigValue::as_int() const {
  if (auto value = std::get_if<int64_t>(&value_)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<bool> ConfigValue::as_bool() const {
  if (auto value = std::get_if<bool>(&value_)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<std::string> ConfigValue::encrypted_blob() const {
  if (auto value = std::get_if<Encrypted>(&value_)) {
    return value->blob;
  }
  return std::nullopt;
}

std::string ConfigValue::to_text() const {
  return std::visit(overloaded{
      [](const std::string& value) { return value; },
      [](int64_t value) { return std::to_string(value); },
      [](bool value) { return std::string(value ? "true" : "false"); },
      [](const Encrypted& value) { return value.blob; }
  }, value_);
}

std::string ConfigValue::kind_to_string(Kind kind) {
  switch (kind) {
    case Kind::STRING:           return "STRING";
    case Kind::INT:              return "INT";
    case Kind::BOOL:             return "BOOL";
    case Kind::ENCRYPTED_STRING: return "ENCRYPTED_STRING";
    default:                     return "UNKNOWN";
  }
}


//==============================================
// JSON
//==============================================

nlohmann::json ConfigValue::to_json() const {
  return std::visit(overloaded{
      [](const std::string& value) { return nlohmann::json(value); },
      [](int64_t value) { return nlohmann::json(value); },
      [](bool value) { return nlohmann::json(value); },
      [](const Encrypted& value) {
        return nlohmann::json{{ENCRYPTED_FLAG, true}, {ENCRYPTED_VALUE, value.blob}};
      }
  }, value_);
}

std::optional<ConfigValue> ConfigValue::from_json(const nlohmann::json& json) {
  if (json.is_string()) {
    return from_string(json.get<std::string>());
  }
  if (json.is_boolean()) {
    return from_bool(json.get<bool>());
  }
  if (json.is_number_unsigned()) {
    auto value = json.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return from_string(json.dump());
    }
    return from_int(static_cast<int64_t>(value));
  }
  if (json.is_number_integer()) {
    return from_int(json.get<int64_t>());
  }
  if (json.is_number_float()) {
    return from_string(json.dump());
  }

  // Encrypted wrapper: {"isEncrypted": true, "value": "<blob>"}
  if (json.is_object() && json.size() == 2 && json.contains(ENCRYPTED_FLAG) &&
      json.contains(ENCRYPTED_VALUE)) {
    const auto& flag = json.at(ENCRYPTED_FLAG);
    const auto& value = json.at(ENCRYPTED_VALUE);
    if (!flag.is_boolean()) {
      return std::nullopt;
    }
    if (flag.get<bool>()) {
      if (!value.is_string()) {
        return std::nullopt;
      }
      return from_encrypted(value.get<std::string>());
    }
    if (value.is_structured()) {
      return std::nullopt;
    }
    return from_json(value);
  }

  return std::nullopt;
}

} // namespace dbridge::config
