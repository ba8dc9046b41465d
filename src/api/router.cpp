#include "notesd/api/router.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace notesd::api {

namespace http = boost::beast::http;

namespace {

constexpr std::string_view kNotesPrefix = "/notes";
constexpr std::string_view kRootMethods = "GET, OPTIONS";
constexpr std::string_view kCollectionMethods = "GET, POST, OPTIONS";
constexpr std::string_view kItemMethods = "GET, PUT, DELETE, OPTIONS";
constexpr std::string_view kDefaultAllowHeaders = "Content-Type, Authorization";

// Request target without query string or trailing slash
std::string_view cleanPath(std::string_view target) {
  auto query = target.find('?');
  if (query != std::string_view::npos) {
    target = target.substr(0, query);
  }
  while (target.size() > 1 && target.back() == '/') {
    target.remove_suffix(1);
  }
  return target;
}

nlohmann::json detail(std::string_view message) {
  return nlohmann::json{{"detail", std::string(message)}};
}

} // namespace

std::string CorsPolicy::allowOriginFor(std::string_view origin) const {
  bool wildcard = std::find(allow_origins.begin(), allow_origins.end(), "*") != allow_origins.end();
  if (wildcard) {
    // A literal "*" is not accepted by browsers together with credentials
    return allow_credentials ? std::string(origin) : std::string("*");
  }
  if (std::find(allow_origins.begin(), allow_origins.end(), origin) != allow_origins.end()) {
    return std::string(origin);
  }
  return {};
}

Router::Router(NoteHandler& handler, CorsPolicy cors)
    : handler_(handler), cors_(std::move(cors)) {}

Response Router::route(const Request& request) const {
  try {
    return dispatch(request);
  } catch (const std::exception& e) {
    spdlog::error("Unhandled exception for {} {}: {}",
                  request.method_string(), request.target(), e.what());
    return render(request, {http::status::internal_server_error, detail("Internal server error")});
  } catch (...) {
    spdlog::error("Unhandled non-standard exception for {} {}",
                  request.method_string(), request.target());
    return render(request, {http::status::internal_server_error, detail("Internal server error")});
  }
}

Response Router::dispatch(const Request& request) const {
  auto path = cleanPath(request.target());
  auto method = request.method();

  if (path == "/") {
    switch (method) {
      case http::verb::get:
        return render(request, handler_.health());
      case http::verb::options:
        return preflight(request, kRootMethods);
      default:
        return methodNotAllowed(request, kRootMethods);
    }
  }

  if (path == kNotesPrefix) {
    switch (method) {
      case http::verb::get:
        return render(request, handler_.listNotes());
      case http::verb::post:
        return render(request, handler_.createNote(request.body()));
      case http::verb::options:
        return preflight(request, kCollectionMethods);
      default:
        return methodNotAllowed(request, kCollectionMethods);
    }
  }

  if (path.size() > kNotesPrefix.size() + 1 && path.starts_with(kNotesPrefix) &&
      path[kNotesPrefix.size()] == '/') {
    auto id = path.substr(kNotesPrefix.size() + 1);
    if (id.find('/') == std::string_view::npos) {
      switch (method) {
        case http::verb::get:
          return render(request, handler_.getNote(id));
        case http::verb::put:
          return render(request, handler_.updateNote(id, request.body()));
        case http::verb::delete_:
          return render(request, handler_.deleteNote(id));
        case http::verb::options:
          return preflight(request, kItemMethods);
        default:
          return methodNotAllowed(request, kItemMethods);
      }
    }
  }

  return render(request, {http::status::not_found, detail("Not Found")});
}

Response Router::render(const Request& request, const ApiResponse& api_response) const {
  Response response{api_response.status, request.version()};
  response.set(http::field::server, "notesd");
  response.keep_alive(request.keep_alive());

  if (api_response.body.has_value()) {
    response.set(http::field::content_type, "application/json");
    response.body() = api_response.body->dump(-1, ' ', false,
                                              nlohmann::json::error_handler_t::replace);
    response.prepare_payload();
  } else if (api_response.status != http::status::no_content) {
    response.content_length(0);
  }

  applyCors(request, response);
  return response;
}

Response Router::preflight(const Request& request, std::string_view allow) const {
  auto origin = request.find(http::field::origin);
  if (origin != request.end() && cors_.allowOriginFor(origin->value()).empty()) {
    return render(request, {http::status::bad_request, detail("Disallowed CORS origin")});
  }

  Response response = render(request, {http::status::no_content, std::nullopt});
  response.set(http::field::access_control_allow_methods, allow);

  auto requested_headers = request.find(http::field::access_control_request_headers);
  if (requested_headers != request.end()) {
    response.set(http::field::access_control_allow_headers, requested_headers->value());
  } else {
    response.set(http::field::access_control_allow_headers, kDefaultAllowHeaders);
  }
  response.set(http::field::access_control_max_age, "600");
  return response;
}

Response Router::methodNotAllowed(const Request& request, std::string_view allow) const {
  Response response = render(request, {http::status::method_not_allowed,
                                       detail("Method Not Allowed")});
  response.set(http::field::allow, allow);
  return response;
}

void Router::applyCors(const Request& request, Response& response) const {
  auto origin = request.find(http::field::origin);
  if (origin == request.end()) {
    return;
  }

  auto allowed = cors_.allowOriginFor(origin->value());
  if (allowed.empty()) {
    return;
  }

  response.set(http::field::access_control_allow_origin, allowed);
  if (cors_.allow_credentials) {
    response.set(http::field::access_control_allow_credentials, "true");
  }
  if (allowed != "*") {
    response.set(http::field::vary, "Origin");
  }
}

} // namespace notesd::api
