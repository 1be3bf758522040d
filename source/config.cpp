#include <ccr/config.hpp>
#include <ccr/process.hpp>
#include <ccr/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ccr {

std::string Config::endpoint() const {
  return fmt::format("http://{}:{}", host, port);
}

std::vector<std::string> split_cmd(const std::string& s){
  std::vector<std::string> out;
  std::string cur; bool in_single=false, in_double=false, esc=false, quoted=false;
  for(char c: s){
    if (esc){ cur.push_back(c); esc=false; continue; }
    if (c=='\\' && !in_single){ esc=true; continue; }
    if (c=='\'' && !in_double){ in_single=!in_single; quoted=true; continue; }
    if (c=='"'  && !in_single){ in_double=!in_double; quoted=true; continue; }
    if (!in_single && !in_double && (c==' '||c=='\t')){
      if (!cur.empty() || quoted){ out.push_back(cur); cur.clear(); quoted=false; }
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty() || quoted) out.push_back(cur);
  return out;
}

static fs::path env_path(const char* name){
  const char* v = ::getenv(name);
  return (v && *v) ? fs::path(v) : fs::path();
}

Config Config::Defaults() {
  Config c;
  fs::path home = env_path("CCR_HOME");
  if (home.empty()) {
    fs::path user_home = env_path("HOME");
    if (user_home.empty()) user_home = fs::temp_directory_path();
    home = user_home / ".claude-code-router";
  }
  c.home_dir = home;
  c.pid_file = home / ".claude-code-router.pid";
  c.logs_dir = home / "logs";

  fs::path tmp = env_path("TMPDIR");
  if (tmp.empty()) tmp = fs::temp_directory_path();
  c.ref_count_file = tmp / "claude-code-reference-count.txt";

  std::error_code ec;
  fs::path server = current_executable().parent_path() / "ccr-server";
  if (fs::exists(server, ec)) c.service_exec = {server.string()};
  else c.service_exec = {"ccr-server"};
  return c;
}

static void parse_int_into(int& dst, const std::string& key, const std::string& val){
  if (auto v = parse_int(val)) { dst = *v; return; }
  spdlog::warn("config: {}='{}' is not a number, keeping {}", key, val, dst);
}

static void parse_bool_into(bool& dst, const std::string& key, std::string val){
  val = util::to_lower(val);
  if (val=="true" || val=="yes" || val=="on" || val=="1") { dst = true; return; }
  if (val=="false" || val=="no" || val=="off" || val=="0") { dst = false; return; }
  spdlog::warn("config: {}='{}' is not a boolean, keeping {}", key, val, dst);
}

static void apply_env(Config& c){
  if (const char* p = ::getenv("CLAUDE_PATH"); p && *p) c.claude_path = p;
  if (c.upstream_api_key.empty()) {
    if (const char* k = ::getenv("OPENAI_API_KEY"); k && *k) c.upstream_api_key = k;
  }
}

Config Config::Load() {
  Config base = Defaults();
  fs::path file = base.config_file();
  return Load(file, std::move(base));
}

Config Config::Load(const fs::path& file, Config c) {
  std::ifstream in(file);
  if (!in) {
    spdlog::debug("config: {} not found, using defaults", file.string());
    apply_env(c);
    return c;
  }

  std::string section;
  std::string line;
  while (std::getline(in, line)) {
    line = util::trim(line);
    if (line.empty() || line[0]=='#' || line[0]==';') continue;
    if (line.front()=='[' && line.back()==']') {
      section = line.substr(1, line.size()-2);
      continue;
    }

    auto eq = line.find('=');
    if (eq==std::string::npos) continue;
    auto key = util::trim(line.substr(0,eq));
    auto val = util::trim(line.substr(eq+1));

    if (section=="Service") {
      if (key=="Host") c.host = val;
      else if (key=="Port") {
        int port = c.port;
        parse_int_into(port, key, val);
        if (port >= 1 && port <= 65535) c.port = port;
        else spdlog::warn("config: Port={} is out of range, keeping {}", port, c.port);
      }
      else if (key=="ExecStart") c.service_exec = split_cmd(val);
      else if (key=="StartupTimeoutMs") parse_int_into(c.startup_timeout_ms, key, val);
      else if (key=="StartupDelayMs") parse_int_into(c.startup_delay_ms, key, val);
      else if (key=="AutoShutdown") parse_bool_into(c.auto_shutdown, key, val);
      else if (key=="LogLevel") c.log_level = util::to_lower(val);
      else if (key=="LogMaxMB") parse_int_into(c.log_max_mb, key, val);
      else spdlog::warn("config: unknown key [Service] {}", key);

    } else if (section=="Client") {
      if (key=="ClaudePath") c.claude_path = val;
      else if (key=="APIKey") c.api_key = val;
      else if (key=="ApiTimeoutMs") parse_int_into(c.api_timeout_ms, key, val);
      else spdlog::warn("config: unknown key [Client] {}", key);

    } else if (section=="Upstream") {
      if (key=="BaseUrl") c.upstream_base_url = val;
      else if (key=="APIKey") c.upstream_api_key = val;
      else if (key=="Model") c.model = val;
      else if (key=="Prompt") c.prompt = val;
      else if (key=="MaxTokens") parse_int_into(c.max_tokens, key, val);
      else spdlog::warn("config: unknown key [Upstream] {}", key);

    } else {
      spdlog::warn("config: key {} outside a known section", key);
    }
  }

  if (c.service_exec.empty()) {
    spdlog::warn("config: empty ExecStart, falling back to ccr-server");
    c.service_exec = {"ccr-server"};
  }
  apply_env(c);
  return c;
}

} // namespace ccr
