#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "api/api_client.hpp"
#include "config/config_store.hpp"
#include "session/session_token_manager.hpp"

namespace dbridge {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(config::ConfigStore& config, session::SessionTokenManager& session, api::ApiClient& api,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    config::ConfigStore& config_;
    session::SessionTokenManager& session_;
    api::ApiClient& api_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    // Configuration
    void handle_show_command();
    void handle_get_command(const std::string& key);
    void handle_set_command(const std::string& key, const std::string& value, bool encrypt);
    void handle_unset_command(const std::string& key);
    void handle_save_command();
    void handle_validate_command();
    // Session
    void handle_login_command();
    void handle_status_command();
    // Devices
    void handle_devices_command();
    void handle_state_command(const std::string& device_id);
    void handle_power_command(const std::string& device_id, bool turn_on);
    void handle_dim_command(const std::string& device_id, const std::string& level);
    void handle_color_command(const std::string& device_id, const std::string& kelvin);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace dbridge
