#include <ccr/vision.hpp>
#include <ccr/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ccr {

VisionOptions VisionOptions::From(const Config& cfg){
  VisionOptions o;
  o.model = cfg.model;
  o.prompt = cfg.prompt;
  o.max_tokens = cfg.max_tokens;
  return o;
}

HttpChatClient::HttpChatClient(std::string base_url, std::string api_key, int timeout_ms)
  : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back()=='/') base_url_.pop_back();
}

std::optional<http::Response> HttpChatClient::create_completion(const std::string& request_json){
  std::unordered_map<std::string,std::string> headers;
  headers["Content-Type"] = "application/json";
  if (!api_key_.empty()) headers["Authorization"] = "Bearer " + api_key_;
  return http::post(base_url_ + "/chat/completions", request_json, headers, timeout_ms_);
}

std::string build_vision_request(const VisionOptions& opts,
                                 const std::string& mime_type,
                                 const std::string& image_base64){
  return fmt::format(
      R"({{"model":"{}","messages":[{{"role":"user","content":[)"
      R"({{"type":"text","text":"{}"}},)"
      R"({{"type":"image_url","image_url":{{"url":"data:{};base64,{}"}}}}]}}],)"
      R"("max_tokens":{}}})",
      util::json_escape(opts.model), util::json_escape(opts.prompt),
      util::json_escape(mime_type), util::json_escape(image_base64),
      opts.max_tokens);
}

http::Response handle_upload_image(const http::Request& req,
                                   ChatClient& client,
                                   const VisionOptions& opts){
  auto image = util::json_string_field(req.body, "imageData");
  if (!image || image->empty()) {
    return http::json_response(400, R"({"error":"No image data provided"})");
  }
  auto mime = util::json_string_field(req.body, "mimeType");
  std::string mime_type = (mime && !mime->empty()) ? *mime : "image/jpeg";

  spdlog::info("[upload-image] {} ({} base64 chars) -> {}", mime_type, image->size(), opts.model);
  auto upstream = client.create_completion(build_vision_request(opts, mime_type, *image));
  if (!upstream) {
    spdlog::error("[upload-image] upstream unreachable");
    return http::json_response(500, R"({"error":"Failed to process image"})");
  }
  if (!upstream->ok()) {
    spdlog::error("[upload-image] upstream status={} body={}", upstream->status, upstream->body);
    return http::json_response(500, R"({"error":"Failed to process image"})");
  }
  return http::json_response(200, std::move(upstream->body));
}

} // namespace ccr
