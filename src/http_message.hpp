#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

inline constexpr std::size_t kMaxHttpHeadBytes = 16 * 1024;
inline constexpr std::size_t kMaxHttpRequestBody = 1024 * 1024;

// Header names are stored lower-cased.
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string target;     // as sent, including any query
  std::string path;       // target without the query
  std::string version;
  HttpHeaders headers;
  std::string body;

  std::string header(const std::string& name) const;
  std::optional<uint64_t> content_length() const;
};

// A region of a file sent as the response body.
struct FileBody {
  std::filesystem::path path;
  uint64_t offset = 0;
  uint64_t length = 0;
};

struct HttpResponse {
  int status = 200;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::optional<FileBody> file;
  // Called once the body was written (true) or the write failed (false).
  std::function<void(bool)> on_complete;

  void set_header(const std::string& name, const std::string& value);
  uint64_t body_length() const { return file ? file->length : body.size(); }

  static HttpResponse json(int status, const nlohmann::json& doc);
  static HttpResponse error(int status, const std::string& message);
};

struct HttpResponseHead {
  int status = 0;
  std::string reason;
  HttpHeaders headers;

  std::string header(const std::string& name) const;
  std::optional<uint64_t> content_length() const;
};

const char* http_status_text(int status);

// Both parsers take the bytes up to and excluding the blank line and throw
// std::invalid_argument on malformed input.
HttpRequest parse_request_head(const std::string& head);
HttpResponseHead parse_response_head(const std::string& head);

std::string serialize_response_head(const HttpResponse& response);
std::string serialize_request(const std::string& method,
                              const std::string& host,
                              const std::string& target,
                              const HttpHeaders& headers,
                              const std::string& body);

// "/api/transfer/abc/3" -> {"api","transfer","abc","3"}
std::vector<std::string> split_path(const std::string& path);
