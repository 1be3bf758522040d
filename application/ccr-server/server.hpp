#pragma once
#include <ccr/http.hpp>
#include <functional>
#include <string>
#include <memory>

namespace server_ns {

class Server {
public:
  using Handler = std::function<ccr::http::Response(const ccr::http::Request&)>;
  Server(const std::string& addr, unsigned short port, Handler h);
  ~Server();
  // port 0 binds an ephemeral port; port() reports the bound one
  unsigned short port() const;
  // accepts and answers a single connection
  void serve_one();
  void run();
private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}
