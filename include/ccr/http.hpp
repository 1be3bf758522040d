#pragma once
#include <optional>
#include <string>
#include <unordered_map>

namespace ccr {
namespace http {

struct Request {
  std::string method;
  std::string path;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

struct Url {
  std::string host;
  std::string port = "80";
  std::string path = "/";
};

std::string reason_phrase(int code);
std::optional<Url> parse_url(const std::string &url);

std::optional<Response>
post(const std::string &url, const std::string &body,
     const std::unordered_map<std::string, std::string> &headers,
     int timeout_ms);

// parses "HTTP/x.y NNN ..." + headers + body of a complete response
std::optional<Response> parse_response(const std::string &raw);

Response json_response(int status, std::string body);

} // namespace http
} // namespace ccr
