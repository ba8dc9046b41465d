#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "notesd/api/router.hpp"
#include "notesd/common.hpp"

namespace notesd::server {

/**
 * @brief Asynchronous HTTP/1.1 server
 *
 * Accepts connections on the given io_context and serves requests through
 * the Router, one request at a time per connection with keep-alive. The
 * io_context may be run from several threads; each connection is bound to
 * its own strand.
 */
class HttpServer {
public:
  struct Options {
    std::string host = "0.0.0.0";
    unsigned short port = 8000;          // 0 picks an ephemeral port
    std::size_t body_limit = 1024 * 1024;
    std::chrono::seconds idle_timeout{30};
  };

  HttpServer(boost::asio::io_context& ioc, Options options, const api::Router& router);
  ~HttpServer() = default;

  // Non-copyable
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Open, bind and listen, then start accepting
   * @return kNetworkError if the address is invalid or the port unavailable
   */
  Result<void> start();

  /// Stop accepting new connections; open sessions finish their current exchange
  void stop();

  /// Bound port, valid after a successful start()
  unsigned short port() const;

private:
  void doAccept();

  boost::asio::io_context& ioc_;
  Options options_;
  const api::Router& router_;
  boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace notesd::server
