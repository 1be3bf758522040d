#pragma once
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

// One-shot loopback HTTP responder for client tests.
class FakeHttpServer {
public:
  explicit FakeHttpServer(std::string reply) : reply_(std::move(reply)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    th_ = std::thread([this]{ serve_once(); });
  }

  ~FakeHttpServer() {
    if (th_.joinable()) th_.join();
    ::close(fd_);
  }

  int port() const { return port_; }

  // valid after the client call returned
  const std::string& request() {
    if (th_.joinable()) th_.join();
    return request_;
  }

private:
  void serve_once() {
    int c = ::accept(fd_, nullptr, nullptr);
    if (c < 0) return;
    char buf[8192];
    size_t want = std::string::npos;
    for (;;) {
      ssize_t n = ::recv(c, buf, sizeof(buf), 0);
      if (n <= 0) break;
      request_.append(buf, static_cast<size_t>(n));
      auto head = request_.find("\r\n\r\n");
      if (head != std::string::npos && want == std::string::npos) {
        auto cl = request_.find("Content-Length: ");
        size_t body = cl == std::string::npos ? 0 : std::stoul(request_.substr(cl + 16));
        want = head + 4 + body;
      }
      if (want != std::string::npos && request_.size() >= want) break;
    }
    ::send(c, reply_.data(), reply_.size(), MSG_NOSIGNAL);
    ::close(c);
  }

  std::string reply_;
  std::string request_;
  int fd_{-1};
  int port_{0};
  std::thread th_;
};
