#include "server.hpp"
#include <ccr/util.hpp>
#include <ccr/state.hpp>
#include <asio.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <sstream>

namespace server_ns {

using ccr::http::Request;
using ccr::http::Response;

static constexpr size_t kMaxHead = 64 * 1024;
static constexpr size_t kMaxBody = 64 * 1024 * 1024;

struct Server::Impl {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor;
  Handler handler;

  Impl(const std::string& host, unsigned short port, Handler h)
    : acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address(host), port)),
      handler(std::move(h)) {}
};

// a request that could not be read; status says how to answer it
struct ReadError {
  int status;
  const char* body;
};

static bool parse_head(const std::string& head, Request& req) {
  std::istringstream in(head);
  std::string line;
  if (!std::getline(in, line)) return false;
  if (!line.empty() && line.back()=='\r') line.pop_back();

  std::istringstream start(line);
  std::string target, version;
  if (!(start >> req.method >> target >> version)) return false;
  req.path = target.substr(0, target.find('?'));

  while (std::getline(in, line)) {
    if (!line.empty() && line.back()=='\r') line.pop_back();
    if (line.empty()) break;
    auto col = line.find(':');
    if (col == std::string::npos) continue;
    req.headers[ccr::util::to_lower(ccr::util::trim(line.substr(0, col)))] =
        ccr::util::trim(line.substr(col+1));
  }
  return true;
}

static std::optional<ReadError> read_request(asio::ip::tcp::socket& sock, Request& req) {
  asio::streambuf buf(kMaxHead + kMaxBody);
  asio::error_code ec;
  size_t head_len = asio::read_until(sock, buf, "\r\n\r\n", ec);
  if (ec) return ReadError{400, R"({"error":"Malformed request"})"};

  std::string head(asio::buffers_begin(buf.data()), asio::buffers_begin(buf.data()) + head_len);
  buf.consume(head_len);
  if (head_len > kMaxHead || !parse_head(head, req))
    return ReadError{400, R"({"error":"Malformed request"})"};

  auto it = req.headers.find("content-length");
  if (it == req.headers.end()) return std::nullopt;

  auto len = ccr::parse_int(it->second);
  if (!len || *len < 0) return ReadError{400, R"({"error":"Bad Content-Length"})"};
  if (static_cast<size_t>(*len) > kMaxBody) {
    spdlog::warn("{} {}: body of {} bytes refused", req.method, req.path, *len);
    return ReadError{413, R"({"error":"Request body too large"})"};
  }

  size_t want = static_cast<size_t>(*len);
  if (buf.size() < want) asio::read(sock, buf, asio::transfer_exactly(want - buf.size()), ec);
  if (ec || buf.size() < want) return ReadError{400, R"({"error":"Truncated body"})"};
  req.body.assign(asio::buffers_begin(buf.data()), asio::buffers_begin(buf.data()) + want);
  return std::nullopt;
}

static void write_response(asio::ip::tcp::socket& sock, const Response& resp) {
  std::ostringstream ss;
  ss << "HTTP/1.1 " << resp.status << " " << ccr::http::reason_phrase(resp.status) << "\r\n";
  for (auto& [k, v] : resp.headers) ss << k << ": " << v << "\r\n";
  if (!resp.headers.count("Content-Type")) ss << "Content-Type: text/plain\r\n";
  ss << "Content-Length: " << resp.body.size() << "\r\nConnection: close\r\n\r\n" << resp.body;

  auto out = ss.str();
  asio::error_code ec;
  asio::write(sock, asio::buffer(out), ec);
  if (ec) spdlog::debug("write response: {}", ec.message());
}

Server::Server(const std::string& host, unsigned short port, Handler h)
  : impl_(std::make_unique<Impl>(host, port, std::move(h))) {}

Server::~Server() = default;

unsigned short Server::port() const {
  return impl_->acceptor.local_endpoint().port();
}

void Server::serve_one() {
  asio::ip::tcp::socket sock(impl_->io);
  asio::error_code ec;
  impl_->acceptor.accept(sock, ec);
  if (ec) {
    spdlog::warn("accept: {}", ec.message());
    return;
  }

  Request req;
  Response resp;
  if (auto bad = read_request(sock, req)) {
    resp = ccr::http::json_response(bad->status, bad->body);
  } else {
    try {
      resp = impl_->handler(req);
    } catch (const std::exception& e) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
      resp = ccr::http::json_response(500, R"({"error":"Internal error"})");
    }
  }
  spdlog::info("{} {} -> {}", req.method, req.path, resp.status);
  write_response(sock, resp);
}

// runs until the process is signalled
void Server::run() {
  for (;;) serve_one();
}

}
