#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include "api/api_client.hpp"
#include "cli/cli.hpp"
#include "config/bridge_settings.hpp"
#include "config/config_store.hpp"
#include "crypto/credential_cipher.hpp"
#include "crypto/key_store.hpp"
#include "http/beast_transport.hpp"
#include "logger/logger.hpp"
#include "session/session_token_manager.hpp"

struct ProgramOptions {
  std::string config_path{dbridge::config::ConfigStore::DEFAULT_CONFIG_PATH};
  std::string log_file{"decora_bridge.log"};
  dbridge::logging::severity_level log_level{dbridge::logging::severity_level::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config file>] [-l <log file>] [-v <level>]\n"
        << "Optional arguments:\n"
        << "  -c, --config     Configuration file (default ./config/leviton.json)\n"
        << "  -l, --log        Log file (default decora_bridge.log)\n"
        << "  -v, --verbosity  trace, debug, info, warning, error or fatal (default info)\n"
        << "Example: " << program_name << " -c ./config/leviton.json -l bridge.log\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {"-c", "--config", "-l", "--log", "-v", "--verbosity"};

  ProgramOptions options;
  if ((argc - 1) % 2 != 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--verbosity") {
      options.log_level = dbridge::logging::severity_from_string(value);
    }
  }

  options.valid = true;
  return options;
}

bool run_bridge(const ProgramOptions& options) {
  try {
    dbridge::logging::init_logging(options.log_file, options.log_level);

    dbridge::crypto::KeyStore key_store(dbridge::crypto::KeyStore::path_for_config(options.config_path));
    dbridge::crypto::CredentialCipher cipher(key_store.ensure_key());
    dbridge::config::ConfigStore config(options.config_path, std::move(cipher));

    auto load_result = config.load();
    BOOST_LOG_TRIVIAL(info) << "Bridge: Configuration " << dbridge::config::load_result_to_string(load_result);
    if (load_result == dbridge::config::LoadResult::NOT_FOUND) {
      std::cout << "No configuration at " << options.config_path
                << ", starting empty. Use 'set' and 'save' to create it.\n";
    }

    auto settings = dbridge::config::BridgeSettings::from_config(config);
    auto transport = std::make_shared<dbridge::http::BeastTransport>(
        dbridge::http::Url::parse(settings.api_base_url), settings.connection_timeout);
    dbridge::session::SessionTokenManager session(transport);
    dbridge::api::ApiClient api(transport, session);

    dbridge::cli::CLI cli(config, session, api);
    cli.run();

    config.clear_sensitive_data();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Bridge: Startup failed: " << e.what();
    std::cerr << "Error: Failed to start bridge: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_bridge(options)) {
    return 1;
  }
  return 0;
}
