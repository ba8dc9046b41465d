#include "notesd/util/text.hpp"

namespace notesd::util {

std::size_t utf8Length(std::string_view text) noexcept {
  std::size_t count = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

}  // namespace notesd::util
