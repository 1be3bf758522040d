#include <ccr/supervisor.hpp>
#include <spdlog/spdlog.h>

#include <thread>
#include <chrono>

namespace ccr {

const char* to_string(ServiceState s){
  return s == ServiceState::Running ? "running" : "stopped";
}

const char* to_string(StartupPhase p){
  switch (p) {
    case StartupPhase::Idle:     return "idle";
    case StartupPhase::Starting: return "starting";
    case StartupPhase::Ready:    return "ready";
    case StartupPhase::Failed:   return "failed";
    case StartupPhase::Stopped:  return "stopped";
  }
  return "unknown";
}

Supervisor::Supervisor(ProcessRegistry registry, SpawnOptions service)
  : registry_(std::move(registry)), service_(std::move(service)) {}

bool Supervisor::is_running() const {
  return is_service_running(registry_);
}

ServiceState Supervisor::state() const {
  return is_running() ? ServiceState::Running : ServiceState::Stopped;
}

void Supervisor::set_phase(StartupPhase p){
  if (p != phase_) spdlog::debug("[service] {} -> {}", to_string(phase_), to_string(p));
  phase_ = p;
}

std::optional<int> Supervisor::launch(const SpawnOptions& opts){
  set_phase(StartupPhase::Starting);
  auto r = spawn_detached(opts);
  if (!r.ok) {
    spdlog::error("[service] spawn failed: {}", r.message);
    set_phase(StartupPhase::Failed);
    return std::nullopt;
  }
  spdlog::debug("[service] spawned {} pid={}", opts.argv.front(), r.pid);
  return r.pid;
}

bool Supervisor::start(){
  if (is_running()) {
    spdlog::info("[service] already running pid={}", registry_.read_pid().value_or(-1));
    set_phase(StartupPhase::Ready);
    return true;
  }
  auto pid = launch(service_);
  if (!pid) return false;
  try {
    registry_.write_pid(*pid);
  } catch (const IoError& e) {
    // an unrecorded service could never be stopped
    spdlog::error("[service] {}", e.what());
    send_terminate(*pid);
    set_phase(StartupPhase::Failed);
    return false;
  }
  return true;
}

bool Supervisor::start_via(const std::vector<std::string>& starter_argv){
  SpawnOptions opts;
  opts.argv = starter_argv;
  return launch(opts).has_value();
}

bool Supervisor::wait_until_ready(std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds initial_delay){
  if (phase_ == StartupPhase::Idle) set_phase(StartupPhase::Starting);
  std::this_thread::sleep_for(initial_delay);

  const auto started = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - started < timeout) {
    if (is_running()) {
      std::this_thread::sleep_for(kSettleDelay);
      set_phase(StartupPhase::Ready);
      return true;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  spdlog::warn("[service] not running after {}ms", timeout.count());
  set_phase(StartupPhase::Failed);
  return false;
}

StopResult Supervisor::stop(){
  StopResult r{};
  r.pid = registry_.read_pid();
  if (r.pid) {
    r.signalled = send_terminate(*r.pid);
    if (r.signalled) spdlog::info("[service] SIGTERM sent to pid={}", *r.pid);
    else spdlog::info("[service] pid={} is gone", *r.pid);
  } else {
    spdlog::debug("[service] no pid record");
  }

  // cleanup runs whatever the signal outcome was
  registry_.clear_pid();
  registry_.clear_reference_count();
  set_phase(StartupPhase::Stopped);
  return r;
}

} // namespace ccr
