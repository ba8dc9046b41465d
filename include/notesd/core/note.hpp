#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "notesd/common.hpp"
#include "notesd/core/note_id.hpp"

namespace notesd::core {

// Title length bounds, counted in Unicode code points
constexpr std::size_t kMinTitleLength = 1;
constexpr std::size_t kMaxTitleLength = 200;

// Note value: identity, text and timestamps. Never mutated in place once
// stored; updates produce a new value through withChanges().
class Note {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  Note(NoteId id, std::string title, std::string content, TimePoint created, TimePoint updated);

  // Create new note with a fresh id and created == updated == now
  static Note create(const std::string& title, const std::string& content, TimePoint now);

  // Getters
  const NoteId& id() const noexcept { return id_; }
  const std::string& title() const noexcept { return title_; }
  const std::string& content() const noexcept { return content_; }
  const TimePoint& created() const noexcept { return created_; }
  const TimePoint& updated() const noexcept { return updated_; }

  // Copy of this note with the supplied fields replaced and updated set to now.
  // updated never moves backwards even if the clock does.
  Note withChanges(const std::optional<std::string>& title,
                   const std::optional<std::string>& content,
                   TimePoint now) const;

  // Validation
  Result<void> validate() const;

  // JSON representation (id, title, content, created_at, updated_at)
  nlohmann::json toJson() const;
  static Result<Note> fromJson(const nlohmann::json& json);

 private:
  NoteId id_;
  std::string title_;
  std::string content_;
  TimePoint created_;
  TimePoint updated_;
};

}  // namespace notesd::core
