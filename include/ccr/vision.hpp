#pragma once
#include <ccr/config.hpp>
#include <ccr/http.hpp>

#include <optional>
#include <string>

namespace ccr {

struct VisionOptions {
  std::string model = "gpt-4o";
  std::string prompt = "Describe the main content of this image.";
  int max_tokens = 300;

  static VisionOptions From(const Config &cfg);
};

// OpenAI-compatible chat completion endpoint
class ChatClient {
public:
  virtual ~ChatClient() = default;
  virtual std::optional<http::Response>
  create_completion(const std::string &request_json) = 0;
};

class HttpChatClient : public ChatClient {
public:
  HttpChatClient(std::string base_url, std::string api_key,
                 int timeout_ms = 60000);

  std::optional<http::Response>
  create_completion(const std::string &request_json) override;

private:
  std::string base_url_;
  std::string api_key_;
  int timeout_ms_;
};

std::string build_vision_request(const VisionOptions &opts,
                                 const std::string &mime_type,
                                 const std::string &image_base64);

http::Response handle_upload_image(const http::Request &req,
                                   ChatClient &client,
                                   const VisionOptions &opts);

} // namespace ccr
