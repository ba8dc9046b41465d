#include "notesd/api/note_handler.hpp"

#include <spdlog/spdlog.h>

#include "notesd/core/note_id.hpp"
#include "notesd/core/note_payload.hpp"

namespace notesd::api {

namespace http = boost::beast::http;

namespace {

constexpr const char* kInternalErrorMessage = "Internal server error";

nlohmann::json detail(const std::string& message) {
  return nlohmann::json{{"detail", message}};
}

} // namespace

http::status statusForError(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNotFound:
      return http::status::not_found;
    case ErrorCode::kValidationError:
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kParseError:
      return http::status::bad_request;
    default:
      return http::status::internal_server_error;
  }
}

NoteHandler::NoteHandler(std::shared_ptr<store::NoteStore> store)
    : store_(std::move(store)) {}

ApiResponse NoteHandler::health() const {
  return {http::status::ok, nlohmann::json{{"message", "Healthy"}}};
}

ApiResponse NoteHandler::listNotes() {
  auto notes = store_->list();
  if (!notes.has_value()) {
    return fromError(notes.error());
  }

  nlohmann::json notes_array = nlohmann::json::array();
  for (const auto& note : *notes) {
    notes_array.push_back(note.toJson());
  }
  return {http::status::ok, std::move(notes_array)};
}

ApiResponse NoteHandler::createNote(std::string_view body) {
  auto payload = core::parseNoteCreate(body);
  if (!payload.has_value()) {
    return fromError(payload.error());
  }

  auto note = store_->create(payload->title, payload->content);
  if (!note.has_value()) {
    return fromError(note.error());
  }
  return {http::status::created, note->toJson()};
}

ApiResponse NoteHandler::getNote(std::string_view id) {
  auto note_id = core::NoteId::fromString(id);
  if (!note_id.has_value()) {
    return fromError(note_id.error());
  }

  auto note = store_->get(*note_id);
  if (!note.has_value()) {
    return fromError(note.error());
  }
  return {http::status::ok, note->toJson()};
}

ApiResponse NoteHandler::updateNote(std::string_view id, std::string_view body) {
  auto note_id = core::NoteId::fromString(id);
  if (!note_id.has_value()) {
    return fromError(note_id.error());
  }

  auto payload = core::parseNoteUpdate(body);
  if (!payload.has_value()) {
    return fromError(payload.error());
  }

  // The "at least one field" rule belongs to the store, so an empty payload goes through
  auto note = store_->update(*note_id, payload->title, payload->content);
  if (!note.has_value()) {
    return fromError(note.error());
  }
  return {http::status::ok, note->toJson()};
}

ApiResponse NoteHandler::deleteNote(std::string_view id) {
  auto note_id = core::NoteId::fromString(id);
  if (!note_id.has_value()) {
    return fromError(note_id.error());
  }

  auto result = store_->remove(*note_id);
  if (!result.has_value()) {
    return fromError(result.error());
  }
  return {http::status::no_content, std::nullopt};
}

ApiResponse NoteHandler::fromError(const Error& error) {
  auto status = statusForError(error.code());
  if (status == http::status::internal_server_error) {
    spdlog::error("[{}] {}", errorCodeToString(error.code()), error.message());
    return {status, detail(kInternalErrorMessage)};
  }
  return {status, detail(error.message())};
}

} // namespace notesd::api
