#pragma once
#include <ccr/process.hpp>
#include <ccr/state.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ccr {

enum class ServiceState { Running, Stopped };

enum class StartupPhase { Idle, Starting, Ready, Failed, Stopped };

struct StopResult {
  std::optional<int> pid;
  bool signalled{false};
};

const char *to_string(ServiceState s);
const char *to_string(StartupPhase p);

class Supervisor {
public:
  static constexpr std::chrono::milliseconds kPollInterval{100};
  static constexpr std::chrono::milliseconds kSettleDelay{500};

  Supervisor(ProcessRegistry registry, SpawnOptions service);

  bool is_running() const;
  ServiceState state() const;
  StartupPhase phase() const { return phase_; }

  bool start();
  bool start_via(const std::vector<std::string> &starter_argv);

  bool wait_until_ready(std::chrono::milliseconds timeout,
                        std::chrono::milliseconds initial_delay);

  StopResult stop();

  const ProcessRegistry &registry() const { return registry_; }

private:
  std::optional<int> launch(const SpawnOptions &opts);
  void set_phase(StartupPhase p);

  ProcessRegistry registry_;
  SpawnOptions service_;
  StartupPhase phase_{StartupPhase::Idle};
};

} // namespace ccr
