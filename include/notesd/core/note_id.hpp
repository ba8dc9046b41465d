#pragma once

#include <string>
#include <string_view>

#include "notesd/common.hpp"

namespace notesd::core {

// Random (version 4) UUID in canonical form:
// 36 characters, lowercase hex, hyphens at 8-4-4-4-12
class NoteId {
 public:
  // Create new random UUID
  static NoteId generate();

  // Parse UUID from string (case-insensitive, normalized to lowercase)
  static Result<NoteId> fromString(std::string_view str);

  // Default constructor creates invalid ID
  NoteId() = default;

  // Get string representation
  std::string toString() const;

  // Comparison operators
  bool operator==(const NoteId& other) const noexcept;
  bool operator!=(const NoteId& other) const noexcept;
  bool operator<(const NoteId& other) const noexcept;

  // Check if ID is valid
  bool isValid() const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const NoteId& id) const noexcept;
  };

 private:
  explicit NoteId(std::string id);

  // Validate UUID format
  static bool isValidFormat(std::string_view str);

  std::string id_;
};

}  // namespace notesd::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<notesd::core::NoteId> : notesd::core::NoteId::Hash {};
}  // namespace std
