#include <ccr/executor.hpp>
#include <ccr/http.hpp>
#include <ccr/process.hpp>
#include <ccr/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstring>

namespace ccr {

ClaudeExecutor::ClaudeExecutor(Config cfg, std::ostream &out, std::ostream &err)
    : cfg_(std::move(cfg)), out_(out), err_(err) {}

int ClaudeExecutor::run_code(const std::vector<std::string> &args) {
  SpawnOptions opts;
  opts.argv = split_cmd(cfg_.claude_path);
  if (opts.argv.empty())
    opts.argv = {"claude"};
  opts.argv.insert(opts.argv.end(), args.begin(), args.end());

  opts.env["ANTHROPIC_BASE_URL"] = cfg_.endpoint();
  opts.env["API_TIMEOUT_MS"] = std::to_string(cfg_.api_timeout_ms);
  if (!cfg_.api_key.empty()) {
    opts.env["ANTHROPIC_API_KEY"] = cfg_.api_key;
    opts.unset_env.push_back("ANTHROPIC_AUTH_TOKEN");
  } else {
    opts.env["ANTHROPIC_AUTH_TOKEN"] = "test";
  }

  spdlog::debug("[code] exec {} ({} args)", opts.argv.front(), args.size());
  auto r = run_and_wait(opts);
  if (r.spawn_errno != 0) {
    spdlog::error("[code] {}: {}", opts.argv.front(), strerror(r.spawn_errno));
    err_ << "Failed to start claude command: " << strerror(r.spawn_errno) << "\n"
         << "Make sure Claude Code is installed: npm install -g "
            "@anthropic-ai/claude-code\n";
    return 1;
  }
  return r.exit_code;
}

int ClaudeExecutor::describe_image(const SniffedPayload &payload) {
  const std::string url = cfg_.endpoint() + "/upload-image";
  const std::string body =
      fmt::format(R"({{"imageData":"{}","mimeType":"{}"}})",
                  payload.base64(), util::json_escape(payload.mime_name()));

  spdlog::debug("[image] POST {} ({}, {} bytes)", url, payload.mime_name(),
                payload.bytes.size());
  auto resp = http::post(url, body, {}, cfg_.api_timeout_ms);
  if (!resp) {
    err_ << "Could not reach the service at " << cfg_.endpoint()
         << ", run `ccr start` first\n";
    return 1;
  }
  if (!resp->ok()) {
    spdlog::error("[image] service replied {}", resp->status);
    err_ << resp->body << "\n";
    return 1;
  }
  out_ << resp->body << "\n";
  return 0;
}

} // namespace ccr
