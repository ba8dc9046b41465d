#include "notesd/app/application.hpp"

#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "notesd/server/http_server.hpp"
#include "notesd/store/memory_store.hpp"
#include "notesd/util/logging.hpp"

namespace notesd::app {

Application::Application()
    : app_("notesd", "In-memory notes CRUD service over HTTP") {
  app_.set_version_flag("--version", notesd::getVersion().toString());
  setupOptions();
}

int Application::run(int argc, char* argv[]) {
  try {
    parseArguments(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  }

  auto config = resolveConfig();
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error().message() << std::endl;
    return 1;
  }

  auto logging_result = util::initializeLogging(config->logging.level, config->logging.file);
  if (!logging_result.has_value()) {
    std::cerr << "Error: " << logging_result.error().message() << std::endl;
    return 1;
  }

  if (!config->configPath().empty()) {
    spdlog::info("Loaded configuration from {}", config->configPath().string());
  }

  auto init_result = initialize(*config);
  if (!init_result.has_value()) {
    spdlog::critical("Failed to initialize: {}", init_result.error().message());
    return 1;
  }

  auto serve_result = serve();
  if (!serve_result.has_value()) {
    spdlog::critical("{}", serve_result.error().message());
    return 1;
  }

  return 0;
}

void Application::parseArguments(int argc, const char* const argv[]) {
  app_.parse(argc, argv);
}

void Application::setupOptions() {
  app_.add_option("--config", options_.config_file, "Path to config file")
      ->check(CLI::ExistingFile);
  app_.add_option("--host", options_.host, "Listen address");
  app_.add_option("-p,--port", options_.port, "Listen port (0 = ephemeral)")
      ->check(CLI::Range(0, 65535));
  app_.add_option("-t,--threads", options_.threads, "Worker threads (0 = one per core)")
      ->check(CLI::NonNegativeNumber);
  app_.add_option("--log-level", options_.log_level,
                  "Log level (trace, debug, info, warn, error, critical, off)");
  app_.add_flag("-v,--verbose", options_.verbose, "Verbose output (debug log level)");
}

Result<config::Config> Application::resolveConfig() const {
  config::Config config;

  std::filesystem::path config_path = options_.config_file;
  if (config_path.empty()) {
    auto default_path = config::Config::defaultConfigPath();
    if (std::filesystem::exists(default_path)) {
      config_path = default_path;
    }
  }

  if (!config_path.empty()) {
    auto load_result = config.load(config_path);
    if (!load_result.has_value()) {
      return std::unexpected(load_result.error());
    }
  }

  // Command line wins over the file
  if (!options_.host.empty()) {
    config.server.host = options_.host;
  }
  if (options_.port >= 0) {
    config.server.port = options_.port;
  }
  if (options_.threads >= 0) {
    config.server.threads = options_.threads;
  }
  if (!options_.log_level.empty()) {
    config.logging.level = options_.log_level;
  } else if (options_.verbose) {
    config.logging.level = "debug";
  }

  auto validation = config.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }

  return config;
}

Result<void> Application::initialize(const config::Config& config) {
  config_ = config;

  store_ = std::make_shared<store::MemoryStore>();
  store_->setChangeCallback([](const core::NoteId& id, const std::string& operation) {
    spdlog::debug("note {} {}", id.toString(), operation);
  });

  handler_ = std::make_unique<api::NoteHandler>(store_);

  api::CorsPolicy cors;
  cors.allow_origins = config_.cors.allow_origins;
  cors.allow_credentials = config_.cors.allow_credentials;
  router_ = std::make_unique<api::Router>(*handler_, std::move(cors));

  return {};
}

Result<void> Application::serve() {
  if (!router_) {
    return std::unexpected(makeError(ErrorCode::kInternalError, "Application not initialized"));
  }

  int threads = config_.effectiveThreads();
  boost::asio::io_context ioc{threads};

  server::HttpServer::Options server_options;
  server_options.host = config_.server.host;
  server_options.port = static_cast<unsigned short>(config_.server.port);
  server_options.body_limit = config_.server.body_limit;
  server_options.idle_timeout = std::chrono::seconds(config_.server.idle_timeout_seconds);

  server::HttpServer server(ioc, server_options, *router_);
  auto start_result = server.start();
  if (!start_result.has_value()) {
    return start_result;
  }

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    spdlog::info("Received signal {}, shutting down", signal_number);
    server.stop();
    ioc.stop();
  });

  spdlog::info("notesd {} serving with {} worker thread(s)", getVersion().toString(), threads);

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(threads - 1));
  for (int i = 1; i < threads; ++i) {
    workers.emplace_back([&ioc]() { ioc.run(); });
  }
  ioc.run();

  for (auto& worker : workers) {
    worker.join();
  }

  // Notes do not outlive the process
  auto remaining = store_->count();
  spdlog::info("Stopped; discarding {} note(s)", remaining.has_value() ? *remaining : 0);
  return {};
}

} // namespace notesd::app
