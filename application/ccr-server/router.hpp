#pragma once
#include <ccr/http.hpp>
#include <ccr/vision.hpp>

namespace router_ns {

class Router {
public:
  Router(ccr::ChatClient& chat, ccr::VisionOptions opts)
    : chat_(chat), opts_(std::move(opts)) {}
  ccr::http::Response handle(const ccr::http::Request& r);

private:
  ccr::ChatClient& chat_;
  ccr::VisionOptions opts_;
};

}
