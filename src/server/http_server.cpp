#include "notesd/server/http_server.hpp"

#include <array>
#include <memory>
#include <optional>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include "notesd/util/time.hpp"

namespace notesd::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::uint32_t kHeaderLimit = 8 * 1024;
constexpr std::chrono::seconds kLingerTimeout{5};

// One client connection: read a request, route it, write the response, repeat
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket&& socket, const api::Router& router,
          std::size_t body_limit, std::chrono::seconds idle_timeout)
      : stream_(std::move(socket)),
        router_(router),
        body_limit_(body_limit),
        idle_timeout_(idle_timeout) {}

  void run() {
    // Start on the connection's strand
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&Session::doRead, shared_from_this()));
  }

private:
  void doRead() {
    parser_.emplace();
    parser_->header_limit(kHeaderLimit);
    parser_->body_limit(body_limit_);

    stream_.expires_after(idle_timeout_);

    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&Session::onRead, shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      doClose();
      return;
    }

    if (ec == http::error::body_limit) {
      sendResponse(tooLarge(parser_->get().version()));
      return;
    }

    // Any other parser failure means the request line or headers are unusable
    if (isParseError(ec)) {
      sendResponse(badRequest());
      return;
    }

    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        spdlog::warn("Read failed: {}", ec.message());
      }
      return;
    }

    auto request = parser_->release();
    auto started = std::chrono::steady_clock::now();
    auto response = router_.route(request);

    spdlog::debug("{} {} -> {} ({})",
                  request.method_string(),
                  request.target(),
                  response.result_int(),
                  util::Time::formatDuration(std::chrono::steady_clock::now() - started));

    sendResponse(std::move(response));
  }

  void sendResponse(api::Response&& response) {
    // Owned by the session until the write completes
    response_ = std::make_shared<api::Response>(std::move(response));
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&Session::onWrite, shared_from_this(),
                                                response_->need_eof()));
  }

  void onWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
      spdlog::warn("Write failed: {}", ec.message());
      return;
    }

    if (close) {
      doClose();
      return;
    }

    response_.reset();
    doRead();
  }

  void doClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
      spdlog::debug("Shutdown failed: {}", ec.message());
      return;
    }
    doDrain();
  }

  // Discard unread input until the peer closes, so closing with pending
  // request bytes does not reset the connection before the response is read
  void doDrain() {
    stream_.expires_after(kLingerTimeout);
    stream_.async_read_some(net::buffer(discard_),
                            beast::bind_front_handler(&Session::onDrain, shared_from_this()));
  }

  void onDrain(beast::error_code ec, std::size_t) {
    if (!ec) {
      doDrain();
    }
  }

  static bool isParseError(const beast::error_code& ec) {
    return ec.category() == beast::error_code(http::error::bad_target).category() &&
           ec != http::error::partial_message;
  }

  static api::Response errorResponse(http::status status, unsigned version, const char* message) {
    api::Response response{status, version};
    response.set(http::field::server, "notesd");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(false);
    response.body() = nlohmann::json{{"detail", message}}.dump();
    response.prepare_payload();
    return response;
  }

  static api::Response tooLarge(unsigned version) {
    return errorResponse(http::status::payload_too_large, version, "Request body too large");
  }

  static api::Response badRequest() {
    return errorResponse(http::status::bad_request, 11, "Malformed HTTP request");
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<api::Response> response_;
  std::array<char, 4096> discard_{};
  const api::Router& router_;
  std::size_t body_limit_;
  std::chrono::seconds idle_timeout_;
};

} // namespace

HttpServer::HttpServer(net::io_context& ioc, Options options, const api::Router& router)
    : ioc_(ioc),
      options_(std::move(options)),
      router_(router),
      acceptor_(net::make_strand(ioc)) {}

Result<void> HttpServer::start() {
  beast::error_code ec;

  auto address = net::ip::make_address(options_.host, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Invalid listen address '" + options_.host + "': " + ec.message()));
  }

  tcp::endpoint endpoint{address, options_.port};

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Failed to open socket: " + ec.message()));
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Failed to set SO_REUSEADDR: " + ec.message()));
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Failed to bind " + options_.host + ":" +
                                         std::to_string(options_.port) + ": " + ec.message()));
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Failed to listen: " + ec.message()));
  }

  spdlog::info("Listening on {}:{}", options_.host, port());
  doAccept();
  return {};
}

void HttpServer::stop() {
  net::post(acceptor_.get_executor(), [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      spdlog::warn("Failed to close acceptor: {}", ec.message());
    }
  });
}

unsigned short HttpServer::port() const {
  beast::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

void HttpServer::doAccept() {
  // Each connection gets its own strand
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
      return;
    }

    if (ec) {
      spdlog::warn("Accept failed: {}", ec.message());
    } else {
      std::make_shared<Session>(std::move(socket), router_,
                                options_.body_limit, options_.idle_timeout)->run();
    }

    if (acceptor_.is_open()) {
      doAccept();
    }
  });
}

} // namespace notesd::server
