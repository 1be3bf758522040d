#pragma once
#include <ccr/state.hpp>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace ccr {

struct SpawnOptions {
  std::vector<std::string> argv;
  std::unordered_map<std::string, std::string> env;
  std::vector<std::string> unset_env;
  std::filesystem::path working_dir;
};

struct SpawnResult {
  bool ok{false};
  int pid{0}; // the detached process, valid when ok
  int error{0};
  std::string message;
};

struct ExecResult {
  int exit_code{-1};
  int spawn_errno{0};
};

bool pid_alive(int pid);
bool send_terminate(int pid);

bool is_service_running(const ProcessRegistry &registry);

// Unlinks the pid file only while it still names `pid`. Async-signal-safe.
bool remove_pid_file_if_owned(const char *path, int pid);

// double fork + setsid, stdio on /dev/null; the caller never waits on it.
// Returns once the detached process has exec'd (or failed to).
SpawnResult spawn_detached(const SpawnOptions &opts);

// fork/exec with inherited stdio, waits for the exit status
ExecResult run_and_wait(const SpawnOptions &opts);

std::filesystem::path current_executable(const char *argv0 = nullptr);

} // namespace ccr
