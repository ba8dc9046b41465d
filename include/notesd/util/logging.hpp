#pragma once

#include <filesystem>
#include <string>

#include "notesd/common.hpp"

namespace notesd::util {

// Install the default "notesd" spdlog logger: coloured stderr sink plus an
// optional rotating file sink. Safe to call more than once; the last call wins.
Result<void> initializeLogging(const std::string& level, const std::filesystem::path& log_file = {});

}  // namespace notesd::util
