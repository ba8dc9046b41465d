#pragma once

#include <chrono>
#include <string>

#include "notesd/common.hpp"

namespace notesd::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 string in UTC with microsecond precision
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point (fraction of up to 9 digits, 'Z' or +hh:mm offset)
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();

  // Format duration for human reading
  static std::string formatDuration(std::chrono::nanoseconds duration);
};

}  // namespace notesd::util
