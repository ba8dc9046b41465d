#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "notesd/api/note_handler.hpp"
#include "notesd/api/router.hpp"
#include "notesd/common.hpp"
#include "notesd/config/config.hpp"
#include "notesd/store/note_store.hpp"

namespace notesd::app {

/**
 * @brief Command line options; unset values fall back to the config file
 */
struct CommandLineOptions {
  std::string config_file;  // --config: Path to config file
  std::string host;         // --host: Listen address
  int port = -1;            // --port: Listen port
  int threads = -1;         // --threads: Worker threads
  std::string log_level;    // --log-level: Log level name
  bool verbose = false;     // --verbose: Shorthand for --log-level debug
};

/**
 * @brief Composition root of the service
 *
 * Owns the single NoteStore for the lifetime of the process and wires it
 * through the handler and router into the HTTP server.
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Parse the command line and serve until SIGINT/SIGTERM
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Parse argv into the command line options
   * @throws CLI::ParseError on invalid input, and for --help / --version
   */
  void parseArguments(int argc, const char* const argv[]);

  /**
   * @brief Build the effective configuration: file (explicit or default), then command line
   */
  Result<config::Config> resolveConfig() const;

  /**
   * @brief Create the store, handler and router for a configuration
   */
  Result<void> initialize(const config::Config& config);

  /**
   * @brief Run the HTTP server on the configured worker threads; blocks
   */
  Result<void> serve();

private:
  void setupOptions();

  CLI::App app_;
  CommandLineOptions options_;
  config::Config config_;

  std::shared_ptr<store::NoteStore> store_;
  std::unique_ptr<api::NoteHandler> handler_;
  std::unique_ptr<api::Router> router_;
};

} // namespace notesd::app
