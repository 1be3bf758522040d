#include <catch2/catch_all.hpp>
#include <ccr/config.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

using namespace ccr;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("ccr_cfg_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

TEST_CASE("defaults follow CCR_HOME") {
  auto d = mkd("home");
  ::setenv("CCR_HOME", d.c_str(), 1);
  auto c = Config::Defaults();
  ::unsetenv("CCR_HOME");

  REQUIRE(c.home_dir == d);
  REQUIRE(c.pid_file == d / ".claude-code-router.pid");
  REQUIRE(c.logs_dir == d / "logs");
  REQUIRE(c.config_file() == d / "config.ini");
  REQUIRE(c.ref_count_file.filename() == "claude-code-reference-count.txt");
  REQUIRE(c.port == 3456);
  REQUIRE(c.endpoint() == "http://127.0.0.1:3456");
  REQUIRE_FALSE(c.service_exec.empty());
}

TEST_CASE("missing file keeps defaults") {
  auto d = mkd("missing");
  Config base;
  base.home_dir = d;
  auto c = Config::Load(d / "config.ini", base);
  REQUIRE(c.port == 3456);
  REQUIRE(c.startup_timeout_ms == 10000);
  REQUIRE(c.startup_delay_ms == 1000);
  REQUIRE(c.auto_shutdown == true);
  REQUIRE(c.max_tokens == 300);
}

TEST_CASE("sections and keys are applied") {
  auto d = mkd("full");
  {
    std::ofstream o(d / "config.ini");
    o <<
"# router\n"
"[Service]\n"
"Host = 0.0.0.0\n"
"Port=4000\n"
"ExecStart=/usr/bin/env FOO=1 \"/opt/my server\" --flag\n"
"StartupTimeoutMs=2500\n"
"StartupDelayMs=0\n"
"AutoShutdown=no\n"
"LogLevel=DEBUG\n"
"\n"
"[Client]\n"
"ClaudePath=npx claude\n"
"APIKey=sk-test\n"
"\n"
"[Upstream]\n"
"BaseUrl=http://localhost:9000/v1\n"
"Model=llava\n"
"MaxTokens=512\n";
  }
  ::unsetenv("CLAUDE_PATH");
  auto c = Config::Load(d / "config.ini", Config{});

  REQUIRE(c.host == "0.0.0.0");
  REQUIRE(c.port == 4000);
  REQUIRE(c.endpoint() == "http://0.0.0.0:4000");
  REQUIRE(c.service_exec == std::vector<std::string>{"/usr/bin/env","FOO=1","/opt/my server","--flag"});
  REQUIRE(c.startup_timeout_ms == 2500);
  REQUIRE(c.startup_delay_ms == 0);
  REQUIRE(c.auto_shutdown == false);
  REQUIRE(c.log_level == "debug");
  REQUIRE(c.claude_path == "npx claude");
  REQUIRE(c.api_key == "sk-test");
  REQUIRE(c.upstream_base_url == "http://localhost:9000/v1");
  REQUIRE(c.model == "llava");
  REQUIRE(c.max_tokens == 512);
}

TEST_CASE("bad values keep the previous setting") {
  auto d = mkd("bad");
  {
    std::ofstream o(d / "config.ini");
    o << "[Service]\nPort=abc\nAutoShutdown=maybe\nStartupTimeoutMs=12x\n";
  }
  auto c = Config::Load(d / "config.ini", Config{});
  REQUIRE(c.port == 3456);
  REQUIRE(c.auto_shutdown == true);
  REQUIRE(c.startup_timeout_ms == 10000);
}

TEST_CASE("out of range port keeps the previous setting") {
  auto d = mkd("port");
  for (const char* port : {"70000", "0", "-1"}) {
    std::ofstream(d / "config.ini") << "[Service]\nPort=" << port << "\n";
    auto c = Config::Load(d / "config.ini", Config{});
    REQUIRE(c.port == 3456);
    REQUIRE(c.endpoint() == "http://127.0.0.1:3456");
  }
  std::ofstream(d / "config.ini") << "[Service]\nPort=65535\n";
  REQUIRE(Config::Load(d / "config.ini", Config{}).port == 65535);
}

TEST_CASE("environment overrides") {
  auto d = mkd("env");
  ::setenv("CLAUDE_PATH", "/opt/claude/bin/claude", 1);
  ::setenv("OPENAI_API_KEY", "sk-env", 1);
  auto c = Config::Load(d / "config.ini", Config{});
  ::unsetenv("CLAUDE_PATH");
  ::unsetenv("OPENAI_API_KEY");

  REQUIRE(c.claude_path == "/opt/claude/bin/claude");
  REQUIRE(c.upstream_api_key == "sk-env");
}

TEST_CASE("command lines split like a shell") {
  REQUIRE(split_cmd("claude") == std::vector<std::string>{"claude"});
  REQUIRE(split_cmd("  a  'b c'  \"d\\\"e\" ") == std::vector<std::string>{"a","b c","d\"e"});
  REQUIRE(split_cmd("x ''") == std::vector<std::string>{"x",""});
  REQUIRE(split_cmd("").empty());
}
