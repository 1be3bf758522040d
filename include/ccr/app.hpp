#pragma once
#include <ccr/config.hpp>
#include <ccr/executor.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace ccr {

struct AppEnv {
  Config config;
  int input_fd = 0;
  // detached "<self> start"; filled from /proc/self/exe when empty
  std::vector<std::string> starter;
  std::shared_ptr<CommandExecutor> executor;
  std::ostream *out = &std::cout;
  std::ostream *err = &std::cerr;
};

class App {
public:
  App();
  explicit App(AppEnv env);

  int run(int argc, char **argv);

private:
  AppEnv env_;
};

} // namespace ccr
