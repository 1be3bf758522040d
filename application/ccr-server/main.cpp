#include "server.hpp"
#include "router.hpp"
#include <ccr/config.hpp>
#include <ccr/io.hpp>
#include <ccr/process.hpp>
#include <ccr/vision.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <csignal>
#include <string>
#include <unistd.h>

namespace ccrd_ns {

// read by the signal handler; set once before handlers are installed
static std::string g_pid_file;

// a newer server may already own the record, so ownership is checked here
extern "C" void on_terminate(int) {
  if (!g_pid_file.empty()) ccr::remove_pid_file_if_owned(g_pid_file.c_str(), ::getpid());
  ::_exit(0);
}

static void setup_logging(const ccr::Config& cfg) {
  try {
    ccr::io::ensure_dir(cfg.logs_dir);
    auto file = cfg.logs_dir / "ccr-server.log";
    ccr::io::rotate_logs(file, static_cast<std::uintmax_t>(cfg.log_max_mb) * 1024 * 1024, 3);
    spdlog::set_default_logger(spdlog::basic_logger_mt("ccr-server", file.string()));
  } catch (const std::exception& e) {
    spdlog::warn("file logging disabled: {}", e.what());
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  auto lvl = spdlog::level::from_str(cfg.log_level);
  spdlog::set_level(lvl == spdlog::level::off && cfg.log_level != "off" ? spdlog::level::info : lvl);
  spdlog::flush_on(spdlog::level::info);
}

}

int main() {
  using namespace ccrd_ns;
  auto cfg = ccr::Config::Load();
  setup_logging(cfg);

  g_pid_file = cfg.pid_file.string();
  std::signal(SIGTERM, on_terminate);
  std::signal(SIGINT, on_terminate);
  std::signal(SIGPIPE, SIG_IGN);

  ccr::HttpChatClient chat(cfg.upstream_base_url, cfg.upstream_api_key, cfg.api_timeout_ms);
  router_ns::Router router(chat, ccr::VisionOptions::From(cfg));

  try {
    server_ns::Server srv(cfg.host, static_cast<unsigned short>(cfg.port),
                          [&](const ccr::http::Request& r){ return router.handle(r); });
    spdlog::info("ccr-server listening on {} (pid={})", cfg.endpoint(), ::getpid());
    srv.run();
  } catch (const std::exception& e) {
    spdlog::error("ccr-server failed: {}", e.what());
    if (ccr::remove_pid_file_if_owned(g_pid_file.c_str(), ::getpid()))
      spdlog::info("pid record {} released", g_pid_file);
    return 1;
  }
  return 0;
}
