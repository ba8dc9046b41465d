#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include "notesd/common.hpp"
#include "notesd/store/note_store.hpp"

namespace notesd::api {

/**
 * @brief Transport-neutral outcome of one API operation
 */
struct ApiResponse {
  boost::beast::http::status status = boost::beast::http::status::ok;
  std::optional<nlohmann::json> body;  // empty for 204
};

/**
 * @brief HTTP status for a domain error code
 *
 * kNotFound -> 404, kValidationError / kInvalidArgument / kParseError -> 400,
 * anything else -> 500.
 */
boost::beast::http::status statusForError(ErrorCode code) noexcept;

/**
 * @brief Adapts request inputs to NoteStore calls and store outcomes to responses
 *
 * Each operation performs at most one store call. Errors are rendered as
 * {"detail": "<message>"}; unexpected store errors never leak their message.
 */
class NoteHandler {
public:
  explicit NoteHandler(std::shared_ptr<store::NoteStore> store);

  /// GET / -> 200 {"message": "Healthy"}
  ApiResponse health() const;

  /// GET /notes -> 200 array ordered by created_at
  ApiResponse listNotes();

  /// POST /notes -> 201 note, 400 malformed body
  ApiResponse createNote(std::string_view body);

  /// GET /notes/{id} -> 200 note, 404 absent, 400 malformed id
  ApiResponse getNote(std::string_view id);

  /// PUT /notes/{id} -> 200 note, 404 absent, 400 empty or malformed body
  ApiResponse updateNote(std::string_view id, std::string_view body);

  /// DELETE /notes/{id} -> 204, 404 absent, 400 malformed id
  ApiResponse deleteNote(std::string_view id);

  /// Render an error as a response with its mapped status
  static ApiResponse fromError(const Error& error);

private:
  std::shared_ptr<store::NoteStore> store_;
};

} // namespace notesd::api
