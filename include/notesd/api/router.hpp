#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "notesd/api/note_handler.hpp"

namespace notesd::api {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief Cross-origin policy applied to every response
 */
struct CorsPolicy {
  std::vector<std::string> allow_origins{"*"};
  bool allow_credentials = true;

  /// Value for Access-Control-Allow-Origin, empty when the origin is not allowed
  std::string allowOriginFor(std::string_view origin) const;
};

/**
 * @brief Maps method + path to NoteHandler operations
 *
 * Routes:
 *   GET    /             health
 *   GET    /notes        list
 *   POST   /notes        create
 *   GET    /notes/{id}   get
 *   PUT    /notes/{id}   update
 *   DELETE /notes/{id}   delete
 *   OPTIONS on any of these answers the CORS preflight.
 *
 * route() never throws: an exception escaping a handler becomes a 500.
 */
class Router {
public:
  Router(NoteHandler& handler, CorsPolicy cors);

  Response route(const Request& request) const;

private:
  NoteHandler& handler_;
  CorsPolicy cors_;

  Response dispatch(const Request& request) const;
  Response render(const Request& request, const ApiResponse& api_response) const;
  Response preflight(const Request& request, std::string_view allow) const;
  Response methodNotAllowed(const Request& request, std::string_view allow) const;
  void applyCors(const Request& request, Response& response) const;
};

} // namespace notesd::api
