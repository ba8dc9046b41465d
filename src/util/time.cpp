#include "notesd/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace notesd::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(time);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(time - seconds);

  std::time_t time_t = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(6) << microseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|[+-]\d{2}:\d{2})?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = std::stoi(match[2]) - 1;
  tm.tm_mday = std::stoi(match[3]);
  tm.tm_hour = std::stoi(match[4]);
  tm.tm_min = std::stoi(match[5]);
  tm.tm_sec = std::stoi(match[6]);

  if (tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 ||
      tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  // Input is UTC (or carries an explicit offset), so timegm rather than mktime
  std::time_t time_t = timegm(&tm);
  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  auto time_point = std::chrono::system_clock::from_time_t(time_t);

  if (match[7].matched) {
    std::string fraction = match[7];
    fraction.resize(9, '0');
    auto nanoseconds = std::chrono::nanoseconds(std::stoll(fraction));
    time_point += std::chrono::duration_cast<std::chrono::system_clock::duration>(nanoseconds);
  }

  if (match[8].matched && match[8] != "Z") {
    std::string offset = match[8];
    int sign = offset[0] == '-' ? -1 : 1;
    auto hours = std::chrono::hours(std::stoi(offset.substr(1, 2)));
    auto minutes = std::chrono::minutes(std::stoi(offset.substr(4, 2)));
    time_point -= sign * (hours + minutes);
  }

  return time_point;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

std::string Time::formatDuration(std::chrono::nanoseconds duration) {
  auto hours = std::chrono::duration_cast<std::chrono::hours>(duration);
  duration -= hours;
  auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration);
  duration -= minutes;
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
  duration -= seconds;
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
  duration -= milliseconds;
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration);

  std::ostringstream oss;

  if (hours.count() > 0) {
    oss << hours.count() << "h ";
  }
  if (minutes.count() > 0) {
    oss << minutes.count() << "m ";
  }
  if (seconds.count() > 0 && hours.count() == 0 && minutes.count() == 0) {
    oss << seconds.count();
    if (milliseconds.count() > 0) {
      oss << "." << std::setfill('0') << std::setw(3) << milliseconds.count();
    }
    oss << "s";
  } else if (seconds.count() > 0) {
    oss << seconds.count() << "s";
  } else if (hours.count() == 0 && minutes.count() == 0) {
    // Sub-second durations are what request timing mostly sees
    oss << milliseconds.count() << "." << std::setfill('0') << std::setw(3)
        << microseconds.count() << "ms";
  }

  std::string result = oss.str();
  if (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }

  return result.empty() ? "0s" : result;
}

}  // namespace notesd::util
