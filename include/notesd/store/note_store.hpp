#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "notesd/common.hpp"
#include "notesd/core/note.hpp"
#include "notesd/core/note_id.hpp"

namespace notesd::store {

// Abstract interface for note storage.
//
// Implementations own the authoritative copy of every note and hand out
// values only. Errors:
//   kNotFound         - no live note has the given id
//   kValidationError  - update called with neither field supplied
// Any other code is an unexpected storage failure.
class NoteStore {
 public:
  virtual ~NoteStore() = default;

  // All live notes, ordered by creation time (ties in insertion order)
  virtual Result<std::vector<core::Note>> list() = 0;

  // Store a new note with a fresh id. Inputs are assumed already validated.
  virtual Result<core::Note> create(const std::string& title, const std::string& content) = 0;

  virtual Result<core::Note> get(const core::NoteId& id) = 0;

  // Replace the supplied fields and refresh the update timestamp.
  // At least one of title/content must be present.
  virtual Result<core::Note> update(const core::NoteId& id,
                                    const std::optional<std::string>& title,
                                    const std::optional<std::string>& content) = 0;

  // Permanently delete; the id is never valid again
  virtual Result<void> remove(const core::NoteId& id) = 0;

  virtual Result<size_t> count() = 0;

  // Called after every successful mutation with operation "create", "update" or "delete"
  using ChangeCallback = std::function<void(const core::NoteId&, const std::string& operation)>;
  virtual void setChangeCallback(ChangeCallback callback) = 0;
};

}  // namespace notesd::store
