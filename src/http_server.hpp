#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "http_message.hpp"
#include "log.hpp"

// Minimal HTTP/1.1 server: one request per connection, then close.
class HttpServer {
public:
  using Handler = std::function<HttpResponse(const HttpRequest&)>;

  HttpServer(asio::io_context& io,
             std::string listen_ip,
             uint16_t port,
             Handler handler,
             std::shared_ptr<Logger> logger = nullptr);
  ~HttpServer();

  // Binds and starts accepting. Throws std::runtime_error when the address
  // cannot be bound. Port 0 picks an ephemeral port.
  void start();
  void stop();

  uint16_t port() const { return port_; }
  bool running() const { return running_; }

private:
  void do_accept();

  asio::io_context& io_;
  std::string listen_ip_;
  uint16_t port_;
  std::shared_ptr<Handler> handler_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> running_{false};
};
