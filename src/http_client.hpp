#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "http_message.hpp"
#include "log.hpp"

// Blocking HTTP/1.1 client over a private io_context. Network faults and
// timeouts surface as std::runtime_error (std::system_error for socket
// errors); HTTP error statuses are returned, not thrown.
class HttpClient {
public:
  struct Options {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds io_timeout{30000};
  };

  struct Response {
    HttpResponseHead head;
    std::string body;
  };

  // Returning false from either callback stops the download early.
  using HeadCallback = std::function<bool(const HttpResponseHead&)>;
  using BodyCallback = std::function<bool(const char* data, std::size_t size)>;

  HttpClient();
  explicit HttpClient(std::shared_ptr<Logger> logger, Options options = {});

  Response get(const std::string& host, uint16_t port, const std::string& target,
               const HttpHeaders& headers = {});
  Response post_json(const std::string& host, uint16_t port, const std::string& target,
                     const nlohmann::json& body, const HttpHeaders& headers = {});

  // True when the whole body was delivered, false when a callback stopped it.
  bool get_stream(const std::string& host, uint16_t port, const std::string& target,
                  const HttpHeaders& headers,
                  const HeadCallback& on_head,
                  const BodyCallback& on_body);

private:
  bool exchange(const std::string& host, uint16_t port, const std::string& request,
                const HeadCallback& on_head, const BodyCallback& on_body);

  std::shared_ptr<Logger> logger_;
  Options options_;
};
