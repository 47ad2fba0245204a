#include "http_message.hpp"
#include "settings_manager.hpp"

#include <sstream>
#include <stdexcept>

namespace {

std::string lower(std::string value) { return SettingsManager::to_lower(std::move(value)); }

std::vector<std::string> split_lines(const std::string& head) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while(start <= head.size()) {
    auto end = head.find("\r\n", start);
    if(end == std::string::npos) end = head.size();
    lines.push_back(head.substr(start, end - start));
    start = end + 2;
  }
  return lines;
}

void parse_header_lines(const std::vector<std::string>& lines, HttpHeaders& out) {
  for(std::size_t i = 1; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if(line.empty()) continue;
    auto colon = line.find(':');
    if(colon == std::string::npos || colon == 0) {
      throw std::invalid_argument("malformed header line '" + line + "'");
    }
    out[lower(SettingsManager::trim_copy(line.substr(0, colon)))] =
      SettingsManager::trim_copy(line.substr(colon + 1));
  }
}

std::optional<uint64_t> parse_length(const HttpHeaders& headers) {
  auto it = headers.find("content-length");
  if(it == headers.end()) return std::nullopt;
  const auto& v = it->second;
  if(v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("invalid Content-Length '" + v + "'");
  }
  try {
    return std::stoull(v);
  } catch(const std::out_of_range&) {
    throw std::invalid_argument("Content-Length out of range '" + v + "'");
  }
}

std::string lookup(const HttpHeaders& headers, const std::string& name) {
  auto it = headers.find(lower(name));
  return it == headers.end() ? std::string() : it->second;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const { return lookup(headers, name); }
std::optional<uint64_t> HttpRequest::content_length() const { return parse_length(headers); }
std::string HttpResponseHead::header(const std::string& name) const { return lookup(headers, name); }
std::optional<uint64_t> HttpResponseHead::content_length() const { return parse_length(headers); }

void HttpResponse::set_header(const std::string& name, const std::string& value) {
  for(auto& h : headers) {
    if(lower(h.first) == lower(name)) {
      h.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& doc) {
  HttpResponse r;
  r.status = status;
  r.body = doc.dump();
  r.set_header("Content-Type", "application/json");
  return r;
}

HttpResponse HttpResponse::error(int status, const std::string& message) {
  return json(status, nlohmann::json{{"error", message}});
}

const char* http_status_text(int status) {
  switch(status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 416: return "Range Not Satisfiable";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
  }
  return "Unknown";
}

HttpRequest parse_request_head(const std::string& head) {
  auto lines = split_lines(head);
  if(lines.empty() || lines[0].empty()) throw std::invalid_argument("empty request");
  std::istringstream rl(lines[0]);
  HttpRequest req;
  if(!(rl >> req.method >> req.target >> req.version)) {
    throw std::invalid_argument("malformed request line '" + lines[0] + "'");
  }
  if(req.version.rfind("HTTP/1.", 0) != 0) {
    throw std::invalid_argument("unsupported protocol '" + req.version + "'");
  }
  if(req.target.empty() || req.target[0] != '/') {
    throw std::invalid_argument("request target must be an absolute path");
  }
  req.path = req.target.substr(0, req.target.find('?'));
  parse_header_lines(lines, req.headers);
  return req;
}

HttpResponseHead parse_response_head(const std::string& head) {
  auto lines = split_lines(head);
  if(lines.empty() || lines[0].rfind("HTTP/1.", 0) != 0) {
    throw std::invalid_argument("malformed status line");
  }
  HttpResponseHead out;
  auto sp = lines[0].find(' ');
  if(sp == std::string::npos || sp + 4 > lines[0].size()) {
    throw std::invalid_argument("malformed status line '" + lines[0] + "'");
  }
  auto code = lines[0].substr(sp + 1, 3);
  if(code.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("malformed status code '" + code + "'");
  }
  out.status = std::stoi(code);
  if(sp + 5 <= lines[0].size()) out.reason = lines[0].substr(sp + 5);
  parse_header_lines(lines, out.headers);
  return out;
}

std::string serialize_response_head(const HttpResponse& response) {
  std::ostringstream os;
  os << "HTTP/1.1 " << response.status << " " << http_status_text(response.status) << "\r\n";
  bool has_type = false;
  for(const auto& h : response.headers) {
    if(lower(h.first) == "content-length" || lower(h.first) == "connection") continue;
    if(lower(h.first) == "content-type") has_type = true;
    os << h.first << ": " << h.second << "\r\n";
  }
  if(!has_type && response.body_length() > 0) os << "Content-Type: application/octet-stream\r\n";
  os << "Content-Length: " << response.body_length() << "\r\n";
  os << "Connection: close\r\n\r\n";
  return os.str();
}

std::string serialize_request(const std::string& method,
                              const std::string& host,
                              const std::string& target,
                              const HttpHeaders& headers,
                              const std::string& body) {
  std::ostringstream os;
  os << method << " " << target << " HTTP/1.1\r\n";
  os << "Host: " << host << "\r\n";
  for(const auto& h : headers) os << h.first << ": " << h.second << "\r\n";
  if(!body.empty() || method == "POST") os << "Content-Length: " << body.size() << "\r\n";
  os << "Connection: close\r\n\r\n";
  os << body;
  return os.str();
}

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while(start < path.size()) {
    auto end = path.find('/', start);
    if(end == std::string::npos) end = path.size();
    if(end > start) parts.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return parts;
}
