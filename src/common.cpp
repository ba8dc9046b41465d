#include "notesd/common.hpp"

#include <sstream>

#ifndef NOTESD_VERSION_MAJOR
#define NOTESD_VERSION_MAJOR 0
#define NOTESD_VERSION_MINOR 1
#define NOTESD_VERSION_PATCH 0
#endif

namespace notesd {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef NOTESD_VERSION_BUILD
  return Version{NOTESD_VERSION_MAJOR, NOTESD_VERSION_MINOR, NOTESD_VERSION_PATCH,
                 NOTESD_VERSION_BUILD};
#else
  return Version{NOTESD_VERSION_MAJOR, NOTESD_VERSION_MINOR, NOTESD_VERSION_PATCH, ""};
#endif
}

}  // namespace notesd
