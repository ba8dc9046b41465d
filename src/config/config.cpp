#include "notesd/config/config.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <thread>

#include <toml++/toml.hpp>

namespace notesd::config {

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Server
    if (auto server_table = config_data["server"].as_table()) {
      if (auto value = (*server_table)["host"].value<std::string>()) {
        server.host = resolveEnvVar(*value);
      }
      if (auto value = (*server_table)["port"].value<int64_t>()) {
        server.port = static_cast<int>(*value);
      }
      if (auto value = (*server_table)["threads"].value<int64_t>()) {
        server.threads = static_cast<int>(*value);
      }
      if (auto value = (*server_table)["body_limit"].value<int64_t>()) {
        server.body_limit = *value > 0 ? static_cast<std::size_t>(*value) : 0;
      }
      if (auto value = (*server_table)["idle_timeout_seconds"].value<int64_t>()) {
        server.idle_timeout_seconds = static_cast<int>(*value);
      }
    }

    // CORS
    if (auto cors_table = config_data["cors"].as_table()) {
      if (auto origins = (*cors_table)["allow_origins"].as_array()) {
        cors.allow_origins.clear();
        for (const auto& origin : *origins) {
          if (auto origin_str = origin.value<std::string>()) {
            cors.allow_origins.push_back(*origin_str);
          }
        }
      }
      if (auto value = (*cors_table)["allow_credentials"].value<bool>()) {
        cors.allow_credentials = *value;
      }
    }

    // Logging
    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = resolveEnvVar(*value);
      }
    }

    config_path_ = config_path;
    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  if (server.host.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "server.host must not be empty"));
  }

  if (server.port < 0 || server.port > 65535) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid server.port value: " + std::to_string(server.port)));
  }

  if (server.threads < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid server.threads value: " + std::to_string(server.threads)));
  }

  if (server.body_limit == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "server.body_limit must be positive"));
  }

  if (server.idle_timeout_seconds <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "server.idle_timeout_seconds must be positive"));
  }

  if (!isValidLogLevel(logging.level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid logging.level: " + logging.level));
  }

  return {};
}

int Config::effectiveThreads() const {
  if (server.threads > 0) {
    return server.threads;
  }
  return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

std::filesystem::path Config::defaultConfigPath() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "notesd" / "config.toml";
  }
  const char* home = std::getenv("HOME");
  std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::temp_directory_path();
  return base / ".config" / "notesd" / "config.toml";
}

bool Config::isValidLogLevel(const std::string& level) {
  static const std::array<std::string, 7> kLevels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  return std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end();
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

}  // namespace notesd::config
