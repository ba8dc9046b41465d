#include "notesd/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace notesd::util {

namespace {

constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

}  // namespace

Result<void> initializeLogging(const std::string& level, const std::filesystem::path& log_file) {
  auto log_level = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"
  if (log_level == spdlog::level::off && level != "off") {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown log level: " + level));
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!log_file.empty()) {
    try {
      if (log_file.has_parent_path()) {
        std::filesystem::create_directories(log_file.parent_path());
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file.string(), kMaxLogFileSize, kMaxLogFiles));
    } catch (const std::exception& e) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Failed to open log file " + log_file.string() + ": " + e.what()));
    }
  }

  auto logger = std::make_shared<spdlog::logger>("notesd", sinks.begin(), sinks.end());
  logger->set_pattern(kLogPattern);
  logger->set_level(log_level);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);
  return {};
}

}  // namespace notesd::util
