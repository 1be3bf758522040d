#include <ccr/app.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

int main(int argc, char** argv) {
  // stdout carries command output (image descriptions may be piped on)
  spdlog::set_default_logger(spdlog::stderr_color_mt("ccr"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return ccr::App{}.run(argc, argv);
}
