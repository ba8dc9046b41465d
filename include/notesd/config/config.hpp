#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "notesd/common.hpp"

namespace notesd::config {

// Configuration for the notesd service
class Config {
 public:
  // Built-in defaults; call load() to apply a file
  Config() = default;

  // Server configuration
  struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int threads = 0;                       // 0 = hardware concurrency
    std::size_t body_limit = 1024 * 1024;  // bytes
    int idle_timeout_seconds = 30;
  };
  ServerConfig server;

  // Cross-origin configuration
  struct CorsConfig {
    std::vector<std::string> allow_origins{"*"};
    bool allow_credentials = true;
  };
  CorsConfig cors;

  // Logging configuration
  struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;  // empty = console only
  };
  LoggingConfig logging;

  // Load configuration from file, overriding the values it sets
  Result<void> load(const std::filesystem::path& config_path);

  // Validate configuration
  Result<void> validate() const;

  // Worker threads to run, resolving 0 to the hardware concurrency
  int effectiveThreads() const;

  // Path the configuration was loaded from (empty if defaults only)
  const std::filesystem::path& configPath() const { return config_path_; }

  // Get default config file path ($XDG_CONFIG_HOME/notesd/config.toml)
  static std::filesystem::path defaultConfigPath();

  // Known log level names
  static bool isValidLogLevel(const std::string& level);

 private:
  std::filesystem::path config_path_;

  // Resolve "env:VAR" references
  std::string resolveEnvVar(const std::string& value) const;
};

}  // namespace notesd::config
