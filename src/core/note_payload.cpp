#include "notesd/core/note_payload.hpp"

#include <nlohmann/json.hpp>

#include "notesd/core/note.hpp"
#include "notesd/util/text.hpp"

namespace notesd::core {

namespace {

Result<nlohmann::json> parseObject(std::string_view body) {
  auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded()) {
    return std::unexpected(makeError(ErrorCode::kParseError, "Request body is not valid JSON"));
  }
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Request body must be a JSON object"));
  }
  return json;
}

Result<void> checkTitle(const std::string& title) {
  auto length = util::utf8Length(title);
  if (length < kMinTitleLength) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Field 'title' must not be empty"));
  }
  if (length > kMaxTitleLength) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Field 'title' must be at most " +
                                         std::to_string(kMaxTitleLength) + " characters"));
  }
  return {};
}

Result<void> checkContent(const std::string& content) {
  if (content.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Field 'content' must not be empty"));
  }
  return {};
}

// Reads an optional string member; null counts as absent
Result<std::optional<std::string>> optionalString(const nlohmann::json& json, const char* field) {
  auto it = json.find(field);
  if (it == json.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     std::string("Field '") + field + "' must be a string"));
  }
  return std::optional<std::string>{it->get<std::string>()};
}

Result<NoteCreate> noteCreateFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Request body must be a JSON object"));
  }

  auto title = optionalString(json, "title");
  if (!title.has_value()) {
    return std::unexpected(title.error());
  }
  if (!title->has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Field 'title' is required"));
  }

  auto content = optionalString(json, "content");
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }
  if (!content->has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Field 'content' is required"));
  }

  NoteCreate payload{std::move(**title), std::move(**content)};

  if (auto result = checkTitle(payload.title); !result.has_value()) {
    return std::unexpected(result.error());
  }
  if (auto result = checkContent(payload.content); !result.has_value()) {
    return std::unexpected(result.error());
  }

  return payload;
}

Result<NoteUpdate> noteUpdateFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Request body must be a JSON object"));
  }

  auto title = optionalString(json, "title");
  if (!title.has_value()) {
    return std::unexpected(title.error());
  }

  auto content = optionalString(json, "content");
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  NoteUpdate payload{std::move(*title), std::move(*content)};

  if (payload.title.has_value()) {
    if (auto result = checkTitle(*payload.title); !result.has_value()) {
      return std::unexpected(result.error());
    }
  }
  if (payload.content.has_value()) {
    if (auto result = checkContent(*payload.content); !result.has_value()) {
      return std::unexpected(result.error());
    }
  }

  return payload;
}

}  // namespace

Result<NoteCreate> parseNoteCreate(std::string_view body) {
  auto json = parseObject(body);
  if (!json.has_value()) {
    return std::unexpected(json.error());
  }
  return noteCreateFromJson(*json);
}

Result<NoteUpdate> parseNoteUpdate(std::string_view body) {
  auto json = parseObject(body);
  if (!json.has_value()) {
    return std::unexpected(json.error());
  }
  return noteUpdateFromJson(*json);
}

}  // namespace notesd::core
