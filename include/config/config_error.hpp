#ifndef DBRIDGE_CONFIG_ERROR_HPP
#define DBRIDGE_CONFIG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dbridge::config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigLoadError : public ConfigError {
public:
    explicit ConfigLoadError(const std::string& message)
        : ConfigError("Config load error: " + message) {}
};

class ConfigSaveError : public ConfigError {
public:
    explicit ConfigSaveError(const std::string& message)
        : ConfigError("Config save error: " + message) {}
};

// Outcome of ConfigStore::load; a missing file is an expected first-run state
enum class LoadResult {
    LOADED,
    NOT_FOUND
};

inline const char* load_result_to_string(LoadResult result) {
    switch (result) {
        case LoadResult::LOADED: return "Loaded";
        case LoadResult::NOT_FOUND: return "Not found";
        default: return "Undefined result";
    }
}

} // namespace dbridge::config

#endif // DBRIDGE_CONFIG_ERROR_HPP
