#include <ccr/http.hpp>
#include <ccr/util.hpp>

#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>

namespace ccr {
namespace http {

std::string reason_phrase(int code) {
  switch(code) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    default: return "OK";
  }
}

std::optional<Url> parse_url(const std::string& url){
  if (url.rfind("http://",0)!=0) return std::nullopt;
  std::string rest = url.substr(7);
  Url u;
  std::string host_port;
  auto slash = rest.find('/');
  if (slash!=std::string::npos){ host_port = rest.substr(0,slash); u.path = rest.substr(slash); }
  else host_port = rest;

  u.host = host_port;
  auto colon = host_port.find(':');
  if (colon!=std::string::npos){ u.host = host_port.substr(0,colon); u.port = host_port.substr(colon+1); }
  if (u.host.empty() || u.port.empty()) return std::nullopt;
  return u;
}

static int connect_to(const Url& u, int timeout_ms){
  addrinfo hints{}; hints.ai_socktype = SOCK_STREAM; hints.ai_family = AF_UNSPEC;
  addrinfo* res=nullptr;
  if (int rc = getaddrinfo(u.host.c_str(), u.port.c_str(), &hints, &res); rc!=0) {
    spdlog::debug("getaddrinfo {}: {}", u.host, gai_strerror(rc));
    return -1;
  }

  int sock = -1;
  for (addrinfo* rp=res; rp; rp=rp->ai_next){
    sock = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
    if (sock<0) continue;
    timeval tv{}; tv.tv_sec = timeout_ms/1000; tv.tv_usec = (timeout_ms%1000)*1000;
    ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen)==0) break;
    ::close(sock); sock=-1;
  }
  freeaddrinfo(res);
  return sock;
}

static bool send_all(int sock, const std::string& data){
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(sock, data.data()+sent, data.size()-sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

static std::string header_key(std::string k){
  return util::to_lower(util::trim(std::move(k)));
}

std::optional<Response> parse_response(const std::string& raw){
  auto head_end = raw.find("\r\n\r\n");
  if (head_end==std::string::npos) return std::nullopt;

  Response resp;
  int code=0;
  if (std::sscanf(raw.c_str(), "HTTP/%*s %d", &code)!=1 || code<=0) return std::nullopt;
  resp.status = code;

  std::istringstream hs(raw.substr(0, head_end));
  std::string line;
  std::getline(hs, line); // status line
  while (std::getline(hs, line)) {
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto col = line.find(':');
    if (col==std::string::npos) continue;
    resp.headers[header_key(line.substr(0,col))] = util::trim(line.substr(col+1));
  }

  resp.body = raw.substr(head_end + 4);
  auto cl = resp.headers.find("content-length");
  if (cl != resp.headers.end()) {
    try {
      size_t len = static_cast<size_t>(std::stoul(cl->second));
      if (resp.body.size() > len) resp.body.resize(len);
    } catch (const std::exception& e) {
      spdlog::debug("bad Content-Length '{}': {}", cl->second, e.what());
    }
  }
  return resp;
}

std::optional<Response>
post(const std::string& url, const std::string& body,
     const std::unordered_map<std::string,std::string>& headers,
     int timeout_ms){
  auto u = parse_url(url);
  if (!u) {
    spdlog::error("unsupported url: {}", url);
    return std::nullopt;
  }

  int sock = connect_to(*u, timeout_ms);
  if (sock<0) {
    spdlog::debug("connect {}:{} failed", u->host, u->port);
    return std::nullopt;
  }

  // HTTP/1.0 keeps the reply un-chunked
  std::string req = "POST " + u->path + " HTTP/1.0\r\nHost: " + u->host + ":" + u->port + "\r\n";
  for (auto& [k,v] : headers) req += k + ": " + v + "\r\n";
  if (headers.find("Content-Type")==headers.end()) req += "Content-Type: application/json\r\n";
  req += "Content-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n";
  req += body;

  if (!send_all(sock, req)) { ::close(sock); return std::nullopt; }

  std::string raw;
  char buf[8192];
  for (;;) {
    ssize_t n = ::recv(sock, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    raw.append(buf, static_cast<size_t>(n));
  }
  ::close(sock);
  return parse_response(raw);
}

Response json_response(int status, std::string body){
  Response r;
  r.status = status;
  r.headers["Content-Type"] = "application/json";
  r.body = std::move(body);
  return r;
}

} // namespace http
} // namespace ccr
