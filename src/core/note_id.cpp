#include "notesd/core/note_id.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace notesd::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr size_t kUuidLength = 36;
constexpr size_t kUuidBytes = 16;

bool isHyphenPosition(size_t index) {
  return index == 8 || index == 13 || index == 18 || index == 23;
}

// Generate 128 random bits
std::array<uint8_t, kUuidBytes> generateRandomness() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(
      (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));

  std::array<uint8_t, kUuidBytes> bytes{};
  for (size_t i = 0; i < kUuidBytes; i += 8) {
    uint64_t value = gen();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(value >> (j * 8));
    }
  }

  return bytes;
}

std::string encode(const std::array<uint8_t, kUuidBytes>& bytes) {
  std::string result;
  result.reserve(kUuidLength);

  for (size_t i = 0; i < kUuidBytes; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      result += '-';
    }
    result += kHexDigits[bytes[i] >> 4];
    result += kHexDigits[bytes[i] & 0x0F];
  }

  return result;
}

}  // namespace

NoteId NoteId::generate() {
  auto bytes = generateRandomness();

  // RFC 4122: version 4, variant 10xx
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  return NoteId(encode(bytes));
}

Result<NoteId> NoteId::fromString(std::string_view str) {
  if (!isValidFormat(str)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid note id: " + std::string(str)));
  }

  std::string normalized(str);
  for (char& c : normalized) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  return NoteId(std::move(normalized));
}

std::string NoteId::toString() const {
  return id_;
}

bool NoteId::operator==(const NoteId& other) const noexcept {
  return id_ == other.id_;
}

bool NoteId::operator!=(const NoteId& other) const noexcept {
  return !(*this == other);
}

bool NoteId::operator<(const NoteId& other) const noexcept {
  return id_ < other.id_;
}

bool NoteId::isValid() const noexcept {
  return !id_.empty() && isValidFormat(id_);
}

std::size_t NoteId::Hash::operator()(const NoteId& id) const noexcept {
  return std::hash<std::string>{}(id.id_);
}

NoteId::NoteId(std::string id) : id_(std::move(id)) {}

bool NoteId::isValidFormat(std::string_view str) {
  if (str.length() != kUuidLength) {
    return false;
  }

  for (size_t i = 0; i < str.length(); ++i) {
    if (isHyphenPosition(i)) {
      if (str[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
      return false;
    }
  }

  return true;
}

}  // namespace notesd::core
