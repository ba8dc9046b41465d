#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "notesd/common.hpp"

namespace notesd::core {

// Body of a create request: both fields required
struct NoteCreate {
  std::string title;
  std::string content;
};

// Body of an update request: absent (or null) fields are left unchanged
struct NoteUpdate {
  std::optional<std::string> title;
  std::optional<std::string> content;

  bool empty() const noexcept { return !title.has_value() && !content.has_value(); }
};

// Parse and check a request body. Malformed JSON, a non-object body, a
// field of the wrong type or a length out of bounds yields kInvalidArgument
// (kParseError for unparsable text). Unknown members are ignored.
Result<NoteCreate> parseNoteCreate(std::string_view body);
Result<NoteUpdate> parseNoteUpdate(std::string_view body);

}  // namespace notesd::core
