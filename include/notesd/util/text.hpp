#pragma once

#include <cstddef>
#include <string_view>

namespace notesd::util {

// Number of Unicode code points in a UTF-8 string. Continuation bytes are
// not counted, so malformed sequences never inflate the length.
std::size_t utf8Length(std::string_view text) noexcept;

}  // namespace notesd::util
