#include <ccr/app.hpp>
#include <ccr/cli.hpp>
#include <ccr/io.hpp>
#include <ccr/process.hpp>
#include <ccr/sniff.hpp>
#include <ccr/state.hpp>
#include <ccr/supervisor.hpp>
#include <ccr/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <type_traits>
#include <variant>
#include <unistd.h>

#ifndef CCR_VERSION
#define CCR_VERSION "unknown"
#endif

namespace ccr {

static void print_help(std::ostream &out) {
  out <<
      R"(
Usage: ccr [command]

Commands:
  start         Start service
  stop          Stop service
  status        Show service status (--json for machine output)
  code          Execute code command
  -v, version   Show version information
  -h, help      Show help information

Example:
  ccr start
  ccr code "Write a Hello World"
  cat screenshot.png | ccr
)";
}

static void print_status(std::ostream &out, const Config &cfg,
                         const Supervisor &sup, bool json) {
  auto pid = sup.registry().read_pid();
  bool running = sup.state() == ServiceState::Running;
  int refs = sup.registry().reference_count();

  if (json) {
    out << fmt::format(
               R"({{"running":{},"state":"{}","pid":{},"port":{},"endpoint":"{}","pidFile":"{}","referenceCount":{}}})",
               running ? "true" : "false", to_string(sup.state()),
               running ? pid.value_or(-1) : -1, cfg.port,
               util::json_escape(cfg.endpoint()),
               util::json_escape(sup.registry().pid_file().string()), refs)
        << "\n";
    return;
  }

  out << "\nClaude Code Router Status\n";
  out << "========================================\n";
  if (running) {
    out << "Status:          Running\n";
    out << "Process ID:      " << pid.value_or(-1) << "\n";
    out << "Port:            " << cfg.port << "\n";
    out << "API Endpoint:    " << cfg.endpoint() << "\n";
    out << "PID File:        " << sup.registry().pid_file().string() << "\n";
    out << "Active sessions: " << refs << "\n\n";
    out << "Ready to use! Run the following commands:\n";
    out << "   ccr code    # Start coding with Claude\n";
    out << "   ccr stop    # Stop the service\n";
  } else {
    out << "Status:          Not Running\n\n";
    out << "To start the service:\n";
    out << "   ccr start\n";
  }
  out << "\n";
}

static spdlog::level::level_enum parse_level(const std::string &s) {
  auto lvl = spdlog::level::from_str(s);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && s != "off")
    return spdlog::level::info;
  return lvl;
}

App::App() {
  env_.config = Config::Load();
  env_.input_fd = STDIN_FILENO;
}

App::App(AppEnv env) : env_(std::move(env)) {}

int App::run(int argc, char **argv) {
  const Config &cfg = env_.config;
  std::ostream &out = *env_.out;
  std::ostream &err = *env_.err;
  spdlog::set_level(parse_level(cfg.log_level));

  if (!env_.executor)
    env_.executor = std::make_shared<ClaudeExecutor>(cfg, out, err);
  if (env_.starter.empty())
    env_.starter = {current_executable(argc > 0 ? argv[0] : nullptr).string(),
                    "start"};

  // a piped image wins over whatever argv says
  if (!io::is_terminal(env_.input_fd)) {
    if (auto payload = sniff_payload(io::read_all(env_.input_fd))) {
      spdlog::debug("[stdin] {} image, {} bytes", payload->mime_name(),
                    payload->bytes.size());
      return env_.executor->describe_image(*payload);
    }
  }

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help(out);
    return 1;
  }

  SpawnOptions service;
  service.argv = cfg.service_exec;
  service.working_dir = cfg.home_dir;
  Supervisor sup(ProcessRegistry(cfg.pid_file, cfg.ref_count_file), service);

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help(out);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          out << fmt::format("claude-code-router version: {}\n", CCR_VERSION);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStart>) {
          if (sup.is_running()) {
            out << "Service is already running in the background.\n";
            return 0;
          }
          try {
            io::ensure_dir(cfg.home_dir);
          } catch (const std::exception &e) {
            spdlog::error("cannot create {}: {}", cfg.home_dir.string(), e.what());
            return 1;
          }
          if (!sup.start()) {
            err << "Failed to start service\n";
            return 1;
          }
          out << fmt::format("Service starting on {}\n", cfg.endpoint());
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStop>) {
          auto r = sup.stop();
          if (r.signalled)
            out << "claude code router service has been successfully stopped.\n";
          else
            out << "Failed to stop the service. It may have already been stopped.\n";
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStatus>) {
          print_status(out, cfg, sup, c.json);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdCode>) {
          if (!sup.is_running()) {
            out << "Service not running, starting service...\n";
            if (!sup.start_via(env_.starter)) {
              err << "Failed to start service\n";
              return 1;
            }
            if (!sup.wait_until_ready(
                    std::chrono::milliseconds(cfg.startup_timeout_ms),
                    std::chrono::milliseconds(cfg.startup_delay_ms))) {
              err << "Service startup timeout, please manually run `ccr start` "
                     "to start the service\n";
              return 1;
            }
          }

          const auto &registry = sup.registry();
          registry.increment_reference_count();
          int rc = env_.executor->run_code(c.args);
          int left = registry.decrement_reference_count();

          if (cfg.auto_shutdown && left == 0 && sup.is_running()) {
            spdlog::info("[code] last session closed, stopping service");
            auto r = sup.stop();
            if (r.signalled)
              out << "claude code router service has been successfully stopped.\n";
          }
          return rc;

        } else {
          return 1;
        }
      },
      *pr.cmd);
}

} // namespace ccr
