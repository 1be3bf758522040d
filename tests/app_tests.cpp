#include <catch2/catch_all.hpp>
#include <ccr/app.hpp>
#include <ccr/state.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace ccr;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("ccr_app_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static std::string slurp(const fs::path& p){
  std::ifstream in(p);
  std::stringstream ss; ss << in.rdbuf();
  return ss.str();
}

class RecordingExecutor : public CommandExecutor {
public:
  std::vector<std::vector<std::string>> code_calls;
  std::vector<std::string> image_mimes;
  int code_rc = 0;

  int run_code(const std::vector<std::string>& args) override {
    code_calls.push_back(args);
    return code_rc;
  }
  int describe_image(const SniffedPayload& payload) override {
    image_mimes.push_back(payload.mime_name());
    return 0;
  }
};

struct Harness {
  fs::path dir;
  std::ostringstream out, err;
  std::shared_ptr<RecordingExecutor> exec = std::make_shared<RecordingExecutor>();
  AppEnv env;
  int devnull = -1;

  explicit Harness(const char* name) : dir(mkd(name)) {
    env.config = Config::Defaults();
    env.config.home_dir = dir;
    env.config.pid_file = dir / ".claude-code-router.pid";
    env.config.ref_count_file = dir / "refs.txt";
    env.config.logs_dir = dir / "logs";
    env.config.service_exec = {"/bin/sleep", "5"};
    env.config.startup_delay_ms = 0;
    env.config.startup_timeout_ms = 3000;
    env.config.log_level = "off";
    devnull = ::open("/dev/null", O_RDONLY);
    env.input_fd = devnull;
    env.starter = {"/bin/true"};
    env.executor = exec;
    env.out = &out;
    env.err = &err;
  }
  ~Harness(){ if (devnull >= 0) ::close(devnull); }

  int run(std::vector<std::string> args){
    args.insert(args.begin(), "ccr");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return App(env).run(static_cast<int>(args.size()), argv.data());
  }

  ProcessRegistry registry() const {
    return ProcessRegistry(env.config.pid_file, env.config.ref_count_file);
  }
};

TEST_CASE("no command prints help and fails") {
  Harness h("noargs");
  REQUIRE(h.run({}) == 1);
  REQUIRE(h.out.str().find("Usage: ccr [command]") != std::string::npos);
}

TEST_CASE("unknown command prints help and fails") {
  Harness h("unknown");
  REQUIRE(h.run({"frobnicate"}) == 1);
  REQUIRE(h.out.str().find("Usage: ccr [command]") != std::string::npos);
}

TEST_CASE("help and version succeed") {
  Harness h("version");
  REQUIRE(h.run({"-v"}) == 0);
  REQUIRE(h.out.str().rfind("claude-code-router version: ", 0) == 0);

  Harness h2("help");
  REQUIRE(h2.run({"help"}) == 0);
  REQUIRE(h2.out.str().find("Commands:") != std::string::npos);
}

TEST_CASE("stop without a record reports already stopped") {
  Harness h("stop_none");
  REQUIRE(h.run({"stop"}) == 0);
  REQUIRE(h.out.str().find("It may have already been stopped") != std::string::npos);
}

TEST_CASE("start then stop round trip") {
  Harness h("start_stop");
  REQUIRE(h.run({"start"}) == 0);
  REQUIRE(h.out.str().find("Service starting on http://127.0.0.1:3456") != std::string::npos);

  auto reg = h.registry();
  for (int i = 0; i < 50 && !reg.read_pid(); ++i) ::usleep(20000);
  REQUIRE(reg.read_pid().has_value());

  h.out.str("");
  REQUIRE(h.run({"start"}) == 0);
  REQUIRE(h.out.str() == "Service is already running in the background.\n");

  h.out.str("");
  REQUIRE(h.run({"stop"}) == 0);
  REQUIRE(h.out.str() == "claude code router service has been successfully stopped.\n");
  REQUIRE_FALSE(reg.read_pid().has_value());
  REQUIRE_FALSE(fs::exists(h.env.config.ref_count_file));
}

TEST_CASE("status reports a stopped service") {
  Harness h("status");
  REQUIRE(h.run({"status"}) == 0);
  REQUIRE(h.out.str().find("Status:          Not Running") != std::string::npos);

  h.out.str("");
  REQUIRE(h.run({"status", "--json"}) == 0);
  auto js = h.out.str();
  REQUIRE(js.find(R"("running":false)") != std::string::npos);
  REQUIRE(js.find(R"("pid":-1)") != std::string::npos);
  REQUIRE(js.find(R"("port":3456)") != std::string::npos);
  REQUIRE(js.find(R"("referenceCount":0)") != std::string::npos);
  REQUIRE(js.find(R"("state":"stopped")") != std::string::npos);
}

TEST_CASE("status json escapes paths") {
  Harness h("status_escape");
  h.env.config.pid_file = h.dir / "we\"ird\\dir" / "ccr.pid";

  REQUIRE(h.run({"status", "--json"}) == 0);
  auto js = h.out.str();
  REQUIRE(js.find(R"(we\"ird\\dir/ccr.pid")") != std::string::npos);
  REQUIRE(js.find("we\"ird") == std::string::npos);
}

TEST_CASE("status reports a running service") {
  Harness h("status_run");
  auto reg = h.registry();
  reg.write_pid(::getpid());

  REQUIRE(h.run({"status", "--json"}) == 0);
  REQUIRE(h.out.str().find(R"("running":true)") != std::string::npos);
  REQUIRE(h.out.str().find("\"pid\":" + std::to_string(::getpid())) != std::string::npos);
  reg.clear_pid();
}

TEST_CASE("code starts the service once and forwards args") {
  Harness h("code");
  auto marker = h.dir / "spawns.txt";
  auto pidf = h.env.config.pid_file.string();
  h.env.starter = {"/bin/sh", "-c",
                   "echo spawn >> '" + marker.string() + "'; echo $$ > '" + pidf +
                   "'; exec sleep 5"};
  h.env.config.auto_shutdown = true;
  h.exec->code_rc = 7;

  REQUIRE(h.run({"code", "hello", "--flag"}) == 7);
  REQUIRE(h.out.str().find("Service not running, starting service...") != std::string::npos);
  REQUIRE(slurp(marker) == "spawn\n");
  REQUIRE(h.exec->code_calls.size() == 1);
  REQUIRE(h.exec->code_calls[0] == std::vector<std::string>{"hello", "--flag"});

  // last session closed: auto shutdown cleared the records
  REQUIRE_FALSE(h.registry().read_pid().has_value());
  REQUIRE(h.registry().reference_count() == 0);
}

TEST_CASE("code reuses a running service") {
  Harness h("code_running");
  auto reg = h.registry();
  reg.write_pid(::getpid());
  h.env.starter = {"/nonexistent/ccr-starter"};
  h.env.config.auto_shutdown = false;

  REQUIRE(h.run({"code"}) == 0);
  REQUIRE(h.exec->code_calls.size() == 1);
  REQUIRE(h.out.str().find("starting service") == std::string::npos);
  REQUIRE(reg.reference_count() == 0);
  reg.clear_pid();
}

TEST_CASE("code gives up when the service never comes up") {
  Harness h("code_timeout");
  h.env.starter = {"/bin/true"};
  h.env.config.startup_timeout_ms = 300;

  REQUIRE(h.run({"code", "x"}) == 1);
  REQUIRE(h.err.str().find("Service startup timeout") != std::string::npos);
  REQUIRE(h.exec->code_calls.empty());
}

TEST_CASE("code fails fast when the starter cannot be spawned") {
  Harness h("code_spawn");
  h.env.starter = {"/nonexistent/ccr-starter"};

  REQUIRE(h.run({"code"}) == 1);
  REQUIRE(h.err.str() == "Failed to start service\n");
  REQUIRE(h.exec->code_calls.empty());
}

TEST_CASE("piped png goes to the image path") {
  Harness h("png");
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  const unsigned char png[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0};
  REQUIRE(::write(fds[1], png, sizeof(png)) == static_cast<ssize_t>(sizeof(png)));
  ::close(fds[1]);
  h.env.input_fd = fds[0];

  REQUIRE(h.run({}) == 0);
  ::close(fds[0]);
  REQUIRE(h.exec->image_mimes == std::vector<std::string>{"image/png"});
  REQUIRE(h.exec->code_calls.empty());
}

TEST_CASE("piped text falls through to the command") {
  Harness h("text");
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(::write(fds[1], "hello", 5) == 5);
  ::close(fds[1]);
  h.env.input_fd = fds[0];

  REQUIRE(h.run({"version"}) == 0);
  ::close(fds[0]);
  REQUIRE(h.exec->image_mimes.empty());
}
