#include "cli/cli.hpp"
#include <sstream>
#include <string>
#include <boost/log/trivial.hpp>
#include "config/bridge_settings.hpp"

namespace dbridge {
namespace cli {

namespace {

constexpr const char* PROMPT = "Decora> ";

// Everything after the first `count` words of the line, leading blanks removed
std::string remainder_after(const std::string& line, size_t count) {
  std::istringstream iss(line);
  std::string word;
  for (size_t i = 0; i < count && (iss >> word); ++i) {
  }
  std::string rest;
  std::getline(iss, rest);
  size_t start = rest.find_first_not_of(" \t");
  return start == std::string::npos ? std::string() : rest.substr(start);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(config::ConfigStore& config, session::SessionTokenManager& session, api::ApiClient& api,
         std::istream& in, std::ostream& out)
  : running_(false)
  , config_(config)
  , session_(session)
  , api_(api)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting loop";
  out_ << PROMPT << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    if (command == "quit") {
      running_ = false;
      continue;
    }

    std::vector<std::string> args;
    if (command == "set" || command == "secret") {
      // Values may contain spaces
      std::string key;
      if (iss >> key) {
        args.push_back(key);
        args.push_back(remainder_after(line, 2));
      }
    } else {
      std::string arg;
      while (iss >> arg) {
        args.push_back(arg);
      }
    }

    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      out_ << PROMPT << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command " << command << " with " << args.size() << " arguments";

  if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else if (command == "show" && args.empty()) {
    handle_show_command();
  }
  else if (command == "get" && args.size() == 1) {
    handle_get_command(args[0]);
  }
  else if ((command == "set" || command == "secret") && args.size() == 2 && !args[1].empty()) {
    handle_set_command(args[0], args[1], command == "secret");
  }
  else if (command == "unset" && args.size() == 1) {
    handle_unset_command(args[0]);
  }
  else if (command == "save" && args.empty()) {
    handle_save_command();
  }
  else if (command == "validate" && args.empty()) {
    handle_validate_command();
  }
  else if (command == "login" && args.empty()) {
    handle_login_command();
  }
  else if (command == "status" && args.empty()) {
    handle_status_command();
  }
  else if (command == "devices" && args.empty()) {
    handle_devices_command();
  }
  else if (command == "state" && args.size() == 1) {
    handle_state_command(args[0]);
  }
  else if ((command == "on" || command == "off") && args.size() == 1) {
    handle_power_command(args[0], command == "on");
  }
  else if (command == "dim" && args.size() == 2) {
    handle_dim_command(args[0], args[1]);
  }
  else if (command == "color" && args.size() == 2) {
    handle_color_command(args[0], args[1]);
  }
  else {
    out_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_show_command() {
  if (config_.size() == 0) {
    out_ << "Configuration is empty" << std::endl;
    return;
  }
  for (const auto& key : config_.keys()) {
    if (config_.is_encrypted(key)) {
      out_ << "  " << key << " = ******** (encrypted)" << std::endl;
    } else {
      out_ << "  " << key << " = " << config_.get_string(key) << std::endl;
    }
  }
}

void CLI::handle_get_command(const std::string& key) {
  if (!config_.contains(key)) {
    out_ << "Key not found: " << key << std::endl;
    return;
  }
  if (config_.is_encrypted(key)) {
    out_ << key << " is encrypted and is not displayed" << std::endl;
    return;
  }
  out_ << key << " = " << config_.get_string(key) << std::endl;
}

void CLI::handle_set_command(const std::string& key, const std::string& value, bool encrypt) {
  try {
    // Only text that reads back identically becomes an INT or BOOL
    auto number = config::parse_int(value);
    if (encrypt) {
      config_.set(key, value, true);
    } else if (number && std::to_string(*number) == value) {
      config_.set_int(key, *number);
    } else if (value == "true" || value == "false") {
      config_.set_bool(key, value == "true");
    } else {
      config_.set(key, value);
    }
    out_ << "Set " << key << (encrypt ? " (encrypted)" : "") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error setting " + key, e.what());
  }
}

void CLI::handle_unset_command(const std::string& key) {
  if (config_.remove(key)) {
    out_ << "Removed " << key << std::endl;
  } else {
    out_ << "Key not found: " << key << std::endl;
  }
}

void CLI::handle_save_command() {
  try {
    config_.save();
    out_ << "Configuration saved to " << config_.config_path().string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error saving configuration", e.what());
  }
}

void CLI::handle_validate_command() {
  if (config_.validate()) {
    out_ << "Configuration is valid" << std::endl;
  } else {
    out_ << "Configuration is invalid: host, port (1-65535) and username are required" << std::endl;
  }
}

void CLI::handle_login_command() {
  config::BridgeSettings settings = config::BridgeSettings::from_config(config_);
  if (!settings.has_credentials()) {
    out_ << "Username and password must be configured before login" << std::endl;
    return;
  }
  try {
    session::AuthResult result = session_.authenticate(settings.username, settings.password);
    out_ << "Logged in as " << settings.username << ", token valid for "
         << result.expires_in << " seconds" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error logging in", e.what());
  }
}

void CLI::handle_status_command() {
  session::SessionState::State state = session_.state();
  out_ << "Session: " << state << std::endl;

  if (state == session::SessionState::State::AUTHENTICATED) {
    out_ << (session_.needs_refresh() ? "Token expires within 5 minutes, run 'login' to refresh"
                                      : "Token is valid") << std::endl;
  }
}

void CLI::handle_devices_command() {
  try {
    auto devices = api_.get_devices();
    if (devices.empty()) {
      out_ << "No devices found" << std::endl;
      return;
    }
    for (const auto& device : devices) {
      out_ << "  " << device.to_string() << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing devices", e.what());
  }
}

void CLI::handle_state_command(const std::string& device_id) {
  try {
    out_ << api_.get_device_state(device_id).to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading device state", e.what());
  }
}

void CLI::handle_power_command(const std::string& device_id, bool turn_on) {
  try {
    out_ << api_.set_device_power(device_id, turn_on).to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error switching device", e.what());
  }
}

void CLI::handle_dim_command(const std::string& device_id, const std::string& level) {
  auto brightness = config::parse_int(level);
  if (!brightness || *brightness < api::ApiClient::MIN_BRIGHTNESS || *brightness > api::ApiClient::MAX_BRIGHTNESS) {
    out_ << "Invalid brightness: " << level << " (expected " << api::ApiClient::MIN_BRIGHTNESS
         << "-" << api::ApiClient::MAX_BRIGHTNESS << ")" << std::endl;
    return;
  }
  try {
    out_ << api_.set_device_brightness(device_id, static_cast<int>(*brightness)).to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error dimming device", e.what());
  }
}

void CLI::handle_color_command(const std::string& device_id, const std::string& kelvin) {
  auto temperature = config::parse_int(kelvin);
  if (!temperature || *temperature < api::ApiClient::MIN_COLOR_TEMPERATURE ||
      *temperature > api::ApiClient::MAX_COLOR_TEMPERATURE) {
    out_ << "Invalid color temperature: " << kelvin << " (expected " << api::ApiClient::MIN_COLOR_TEMPERATURE
         << "-" << api::ApiClient::MAX_COLOR_TEMPERATURE << " K)" << std::endl;
    return;
  }
  try {
    out_ << api_.set_device_color(device_id, static_cast<int>(*temperature)).to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error setting color temperature", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                 Display this help message" << std::endl;
  out_ << "  show                 List configuration entries (secrets hidden)" << std::endl;
  out_ << "  get <key>            Print one configuration value" << std::endl;
  out_ << "  set <key> <value>    Set a configuration value" << std::endl;
  out_ << "  secret <key> <value> Set an encrypted configuration value" << std::endl;
  out_ << "  unset <key>          Remove a configuration value" << std::endl;
  out_ << "  save                 Write the configuration file" << std::endl;
  out_ << "  validate             Check host, port and username" << std::endl;
  out_ << "  login                Authenticate with the configured credentials" << std::endl;
  out_ << "  status               Show the session state" << std::endl;
  out_ << "  devices              List devices" << std::endl;
  out_ << "  state <id>           Show the state of device <id>" << std::endl;
  out_ << "  on <id>              Switch device <id> on" << std::endl;
  out_ << "  off <id>             Switch device <id> off" << std::endl;
  out_ << "  dim <id> <0-100>     Set the brightness of device <id>" << std::endl;
  out_ << "  color <id> <kelvin>  Set the color temperature of device <id> (2000-6500)" << std::endl;
  out_ << "  quit                 Exit the shell" << std::endl;
  out_ << "Values typed as plain integers or true/false are stored as numbers or booleans." << std::endl;
  out_ << "host, port, use_ssl, api_base_url and connection_timeout take effect on restart." << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace dbridge
