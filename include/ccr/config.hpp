#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace ccr {

struct Config {
  std::filesystem::path home_dir;
  std::filesystem::path pid_file;
  std::filesystem::path ref_count_file;
  std::filesystem::path logs_dir;

  // [Service]
  std::string host = "127.0.0.1";
  int port = 3456;
  std::vector<std::string> service_exec; // ExecStart split
  int startup_timeout_ms = 10000;
  int startup_delay_ms = 1000;
  bool auto_shutdown = true;
  std::string log_level = "info";
  int log_max_mb = 5;

  // [Client]
  std::string claude_path = "claude";
  std::string api_key;
  int api_timeout_ms = 600000;

  // [Upstream]
  std::string upstream_base_url = "http://127.0.0.1:8000/v1";
  std::string upstream_api_key;
  std::string model = "gpt-4o";
  std::string prompt = "Describe the main content of this image.";
  int max_tokens = 300;

  std::string endpoint() const;
  std::filesystem::path config_file() const { return home_dir / "config.ini"; }

  // locations derived from CCR_HOME / HOME / TMPDIR, everything else default
  static Config Defaults();
  // Defaults() overlaid with the file at home_dir/config.ini and the env
  static Config Load();
  static Config Load(const std::filesystem::path &file, Config base);
};

std::vector<std::string> split_cmd(const std::string &s);

} // namespace ccr
