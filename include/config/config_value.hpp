#ifndef DBRIDGE_CONFIG_VALUE_HPP
#define DBRIDGE_CONFIG_VALUE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace dbridge::config {

/**
 * A single configuration value. Holds exactly one of a plain string, a
 * 64-bit integer, a boolean, or an encrypted string. The encrypted kind
 * carries the stored blob only; decryption is the ConfigStore's job.
 */
class ConfigValue {
public:
    enum class Kind {
        STRING,
        INT,
        BOOL,
        ENCRYPTED_STRING
    };

    // ---- FACTORIES ----
    static ConfigValue from_string(std::string value);
    static ConfigValue from_int(int64_t value);
    static ConfigValue from_bool(bool value);
    static ConfigValue from_encrypted(std::string blob);


    // ---- QUERIES ----
    Kind kind() const;
    bool is_encrypted() const { return kind() == Kind::ENCRYPTED_STRING; }

    // Typed views; empty when the value holds a different kind
    std::optional<std::string> as_string() const;
    std::optional<int64_t> as_int() const;
    std::optional<bool> as_bool() const;
    std::optional<std::string> encrypted_blob() const;

    // Text form of a plain value ("42", "true"). Encrypted values yield the blob.
    std::string to_text() const;


    // ---- JSON ----
    // Plain values become bare scalars; encrypted values become
    // {"isEncrypted": true, "value": "<blob>"}
    nlohmann::json to_json() const;
    // Returns nullopt for shapes that have no ConfigValue form (arrays,
    // nested objects other than the encrypted wrapper)
    static std::optional<ConfigValue> from_json(const nlohmann::json& json);

    bool operator==(const ConfigValue& other) const { return value_ == other.value_; }
    bool operator!=(const ConfigValue& other) const { return !(*this == other); }

    static std::string kind_to_string(Kind kind);

private:
    struct Encrypted {
        std::string blob;
        bool operator==(const Encrypted& other) const { return blob == other.blob; }
    };

    using Storage = std::variant<std::string, int64_t, bool, Encrypted>;

    explicit ConfigValue(Storage value) : value_(std::move(value)) {}

    Storage value_;
};

inline std::ostream& operator<<(std::ostream& os, ConfigValue::Kind kind) {
    os << ConfigValue::kind_to_string(kind);
    return os;
}

} // namespace dbridge::config

#endif // DBRIDGE_CONFIG_VALUE_HPP
