#include "http_client.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace {

// One connection on its own io_context; each step runs the context for at
// most the configured timeout and closes the socket when it expires.
class Channel {
public:
  explicit Channel(std::chrono::milliseconds io_timeout)
    : socket_(io_), io_timeout_(io_timeout) {}

  void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    asio::ip::tcp::resolver resolver(io_);
    std::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if(ec) throw std::system_error(ec, "resolve " + host);
    std::error_code result = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
      [&result](std::error_code e, const asio::ip::tcp::endpoint&){ result = e; });
    wait(result, timeout, "connect to " + host + ":" + std::to_string(port));
  }

  void write(const std::string& data) {
    std::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data),
      [&result](std::error_code e, std::size_t){ result = e; });
    wait(result, io_timeout_, "write");
  }

  // 0 on end of stream.
  std::size_t read_some(char* data, std::size_t size) {
    std::error_code result = asio::error::would_block;
    std::size_t got = 0;
    socket_.async_read_some(asio::buffer(data, size),
      [&result, &got](std::error_code e, std::size_t n){ result = e; got = n; });
    io_.restart();
    io_.run_for(io_timeout_);
    if(result == asio::error::would_block) abort_pending("read");
    if(result == asio::error::eof) return got;
    if(result) throw std::system_error(result, "read");
    return got;
  }

  ~Channel() {
    std::error_code ignored;
    socket_.close(ignored);
  }

private:
  void wait(std::error_code& result, std::chrono::milliseconds timeout, const std::string& what) {
    io_.restart();
    io_.run_for(timeout);
    if(result == asio::error::would_block) abort_pending(what);
    if(result) throw std::system_error(result, what);
  }

  [[noreturn]] void abort_pending(const std::string& what) {
    std::error_code ignored;
    socket_.close(ignored);
    io_.restart();
    io_.run();
    throw std::runtime_error(what + " timed out");
  }

  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  std::chrono::milliseconds io_timeout_;
};

} // namespace

HttpClient::HttpClient() : HttpClient(nullptr) {}

HttpClient::HttpClient(std::shared_ptr<Logger> logger, Options options)
  : logger_(std::move(logger)), options_(options) {}

HttpClient::Response HttpClient::get(const std::string& host, uint16_t port,
                                     const std::string& target, const HttpHeaders& headers) {
  Response out;
  exchange(host, port, serialize_request("GET", host, target, headers, {}),
    [&out](const HttpResponseHead& head){ out.head = head; return true; },
    [&out](const char* data, std::size_t size){ out.body.append(data, size); return true; });
  return out;
}

HttpClient::Response HttpClient::post_json(const std::string& host, uint16_t port,
                                           const std::string& target, const nlohmann::json& body,
                                           const HttpHeaders& headers) {
  HttpHeaders with_type = headers;
  with_type["Content-Type"] = "application/json";
  Response out;
  exchange(host, port, serialize_request("POST", host, target, with_type, body.dump()),
    [&out](const HttpResponseHead& head){ out.head = head; return true; },
    [&out](const char* data, std::size_t size){ out.body.append(data, size); return true; });
  return out;
}

bool HttpClient::get_stream(const std::string& host, uint16_t port, const std::string& target,
                            const HttpHeaders& headers,
                            const HeadCallback& on_head,
                            const BodyCallback& on_body) {
  return exchange(host, port, serialize_request("GET", host, target, headers, {}), on_head, on_body);
}

bool HttpClient::exchange(const std::string& host, uint16_t port, const std::string& request,
                          const HeadCallback& on_head, const BodyCallback& on_body) {
  Channel channel(options_.io_timeout);
  channel.connect(host, port, options_.connect_timeout);
  channel.write(request);
  log_debug(logger_.get(), "HTTP {} -> {}:{}", request.substr(0, request.find("\r\n")), host, port);

  std::array<char, 64 * 1024> buf{};
  std::string pending;
  std::size_t head_end = std::string::npos;
  while(head_end == std::string::npos) {
    auto n = channel.read_some(buf.data(), buf.size());
    if(n == 0) throw std::runtime_error("connection closed before response head");
    pending.append(buf.data(), n);
    head_end = pending.find("\r\n\r\n");
    if(head_end == std::string::npos && pending.size() > kMaxHttpHeadBytes) {
      throw std::runtime_error("response head too large");
    }
  }

  HttpResponseHead head;
  std::optional<uint64_t> length;
  try {
    head = parse_response_head(pending.substr(0, head_end));
    length = head.content_length();
  } catch(const std::invalid_argument& e) {
    throw std::runtime_error(std::string("malformed HTTP response: ") + e.what());
  }
  if(on_head && !on_head(head)) return false;

  uint64_t received = 0;
  auto deliver = [&](const char* data, std::size_t size) {
    if(length) size = static_cast<std::size_t>(std::min<uint64_t>(size, *length - received));
    if(size == 0) return true;
    received += size;
    return !on_body || on_body(data, size);
  };

  std::string rest = pending.substr(head_end + 4);
  if(!rest.empty() && !deliver(rest.data(), rest.size())) return false;
  while(!length || received < *length) {
    auto n = channel.read_some(buf.data(), buf.size());
    if(n == 0) break;
    if(!deliver(buf.data(), n)) return false;
  }
  if(length && received < *length) {
    throw std::runtime_error("connection closed after " + std::to_string(received) +
                             " of " + std::to_string(*length) + " bytes");
  }
  return true;
}
