#include "notesd/core/note.hpp"

#include <algorithm>

#include "notesd/util/text.hpp"
#include "notesd/util/time.hpp"

namespace notesd::core {

Note::Note(NoteId id, std::string title, std::string content, TimePoint created, TimePoint updated)
    : id_(std::move(id)),
      title_(std::move(title)),
      content_(std::move(content)),
      created_(created),
      updated_(updated) {}

Note Note::create(const std::string& title, const std::string& content, TimePoint now) {
  return Note(NoteId::generate(), title, content, now, now);
}

Note Note::withChanges(const std::optional<std::string>& title,
                       const std::optional<std::string>& content,
                       TimePoint now) const {
  Note updated = *this;
  if (title.has_value()) {
    updated.title_ = *title;
  }
  if (content.has_value()) {
    updated.content_ = *content;
  }
  updated.updated_ = std::max(now, updated_);
  return updated;
}

Result<void> Note::validate() const {
  if (!id_.isValid()) {
    return std::unexpected(makeError(ErrorCode::kValidationError, "Invalid note ID"));
  }

  auto title_length = util::utf8Length(title_);
  if (title_length < kMinTitleLength) {
    return std::unexpected(makeError(ErrorCode::kValidationError, "Title cannot be empty"));
  }
  if (title_length > kMaxTitleLength) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Title too long (max " + std::to_string(kMaxTitleLength) +
                                         " characters)"));
  }

  if (content_.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError, "Content cannot be empty"));
  }

  if (updated_ < created_) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "updated_at precedes created_at"));
  }

  return {};
}

nlohmann::json Note::toJson() const {
  nlohmann::json note_json;
  note_json["id"] = id_.toString();
  note_json["title"] = title_;
  note_json["content"] = content_;
  note_json["created_at"] = util::Time::toRfc3339(created_);
  note_json["updated_at"] = util::Time::toRfc3339(updated_);
  return note_json;
}

Result<Note> Note::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError, "Note must be a JSON object"));
  }

  for (const char* field : {"id", "title", "content", "created_at", "updated_at"}) {
    auto it = json.find(field);
    if (it == json.end() || !it->is_string()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       std::string("Missing or non-string field: ") + field));
    }
  }

  auto id = NoteId::fromString(json["id"].get<std::string>());
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto created = util::Time::fromRfc3339(json["created_at"].get<std::string>());
  if (!created.has_value()) {
    return std::unexpected(created.error());
  }

  auto updated = util::Time::fromRfc3339(json["updated_at"].get<std::string>());
  if (!updated.has_value()) {
    return std::unexpected(updated.error());
  }

  Note note(*id, json["title"].get<std::string>(), json["content"].get<std::string>(),
            *created, *updated);

  auto validation_result = note.validate();
  if (!validation_result.has_value()) {
    return std::unexpected(validation_result.error());
  }

  return note;
}

}  // namespace notesd::core
