#include "router.hpp"
#include <spdlog/spdlog.h>

namespace router_ns {

ccr::http::Response Router::handle(const ccr::http::Request& r) {
  spdlog::debug("{} {}", r.method, r.path);
  if (r.path == "/health") {
    if (r.method == "GET") return ccr::http::json_response(200, R"({"status":"ok"})");
    return ccr::http::json_response(405, R"({"error":"method not allowed"})");
  }
  if (r.path == "/upload-image") {
    if (r.method == "POST") return ccr::handle_upload_image(r, chat_, opts_);
    return ccr::http::json_response(405, R"({"error":"method not allowed"})");
  }
  ccr::http::Response resp;
  resp.status = 404;
  resp.body = "not found";
  return resp;
}

}
