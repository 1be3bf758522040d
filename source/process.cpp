#include <ccr/process.hpp>
#include <ccr/io.hpp>

#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace ccr {

bool pid_alive(int pid){
  if (pid <= 0) return false;
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

bool send_terminate(int pid){
  if (pid <= 0) return false;
  if (::kill(pid, SIGTERM) != 0) {
    spdlog::debug("kill({}, SIGTERM): {}", pid, strerror(errno));
    return false;
  }
  return true;
}

bool is_service_running(const ProcessRegistry& registry){
  auto pid = registry.read_pid();
  if (!pid) return false;
  return pid_alive(*pid);
}

bool remove_pid_file_if_owned(const char* path, int pid){
  int fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) return false;
  char buf[32];
  ssize_t n;
  do { n = ::read(fd, buf, sizeof(buf) - 1); } while (n < 0 && errno == EINTR);
  ::close(fd);
  if (n <= 0) return false;

  long recorded = 0;
  bool digits = false;
  for (ssize_t i = 0; i < n; ++i) {
    char c = buf[i];
    if (c >= '0' && c <= '9') {
      recorded = recorded * 10 + (c - '0');
      digits = true;
      if (recorded > 0x7fffffffL) return false;
    } else if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      if (digits) break;
    } else {
      return false;
    }
  }
  if (!digits || recorded != pid) return false;
  return ::unlink(path) == 0;
}

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

// what the detached side reports over the CLOEXEC pipe
struct ChildReport {
  enum Kind : int { Pid = 0, Errno = 1 } kind;
  int value;
};

static void child_report(int fd, ChildReport::Kind kind, int value){
  ChildReport rep{kind, value};
  (void)!::write(fd, &rep, sizeof(rep));
}

[[noreturn]] static void child_fail(int fd){
  child_report(fd, ChildReport::Errno, errno);
  ::close(fd);
  _exit(127);
}

static std::vector<char*> make_argv(const std::vector<std::string>& args){
  std::vector<char*> argv;
  argv.reserve(args.size()+1);
  for (auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
  argv.push_back(nullptr);
  return argv;
}

static void apply_env(const SpawnOptions& opts){
  for (auto& k : opts.unset_env) ::unsetenv(k.c_str());
  for (auto& [k,v] : opts.env) ::setenv(k.c_str(), v.c_str(), 1);
}

// drains reports until every write end is closed (exec or exit)
static int read_child_reports(int fd, int* pid_out){
  int child_errno = 0;
  ChildReport rep{};
  for (;;) {
    ssize_t n = ::read(fd, &rep, sizeof(rep));
    if (n < 0 && errno == EINTR) continue;
    if (n != static_cast<ssize_t>(sizeof(rep))) break;
    if (rep.kind == ChildReport::Errno) child_errno = rep.value;
    else if (pid_out) *pid_out = rep.value;
  }
  ::close(fd);
  return child_errno;
}

SpawnResult spawn_detached(const SpawnOptions& opts){
  SpawnResult r{};
  if (opts.argv.empty()) {
    r.error = EINVAL;
    r.message = "empty command";
    return r;
  }

  // everything the grandchild touches is prepared before fork
  auto argv = make_argv(opts.argv);

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0) {
    r.error = errno;
    r.message = std::string("pipe: ") + strerror(errno);
    return r;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    r.error = errno;
    r.message = std::string("fork: ") + strerror(errno);
    ::close(pfd[0]); ::close(pfd[1]);
    return r;
  }

  if (pid == 0) {
    ::close(pfd[0]);
    if (::setsid() < 0) child_fail(pfd[1]);

    pid_t gc = ::fork();
    if (gc < 0) child_fail(pfd[1]);
    if (gc > 0) _exit(0);

    // grandchild: reparented away from the launcher
    ::umask(022);
    if (!opts.working_dir.empty() && ::chdir(opts.working_dir.c_str()) != 0) child_fail(pfd[1]);

    int devnull = io::open_devnull();
    if (devnull < 0) child_fail(pfd[1]);
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(devnull, STDOUT_FILENO);
    ::dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) ::close(devnull);

    apply_env(opts);

    child_report(pfd[1], ChildReport::Pid, ::getpid());
    ::execvp(argv[0], argv.data());
    child_fail(pfd[1]);
  }

  ::close(pfd[1]);
  int service_pid = 0;
  int child_errno = read_child_reports(pfd[0], &service_pid);

  // reap the intermediate child; the service itself is not ours to wait on
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}

  if (child_errno != 0) {
    r.error = child_errno;
    r.message = opts.argv[0] + ": " + strerror(child_errno);
    return r;
  }
  if (service_pid <= 0) {
    r.error = ECHILD;
    r.message = opts.argv[0] + ": detached process exited before exec";
    return r;
  }
  r.ok = true;
  r.pid = service_pid;
  return r;
}

// like system(3): the client owns the terminal's SIGINT/SIGQUIT while it runs
ExecResult run_and_wait(const SpawnOptions& opts){
  ExecResult r{};
  if (opts.argv.empty()) { r.spawn_errno = EINVAL; return r; }

  auto argv = make_argv(opts.argv);
  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0) { r.spawn_errno = errno; return r; }

  struct sigaction ignore{}, old_int{}, old_quit{};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  ::sigaction(SIGINT, &ignore, &old_int);
  ::sigaction(SIGQUIT, &ignore, &old_quit);
  auto restore = [&]{
    ::sigaction(SIGINT, &old_int, nullptr);
    ::sigaction(SIGQUIT, &old_quit, nullptr);
  };

  pid_t pid = ::fork();
  if (pid < 0) {
    r.spawn_errno = errno;
    ::close(pfd[0]); ::close(pfd[1]);
    restore();
    return r;
  }

  if (pid == 0) {
    ::close(pfd[0]);
    restore();
    if (!opts.working_dir.empty() && ::chdir(opts.working_dir.c_str()) != 0) child_fail(pfd[1]);
    apply_env(opts);
    ::execvp(argv[0], argv.data());
    child_fail(pfd[1]);
  }

  ::close(pfd[1]);
  int child_errno = read_child_reports(pfd[0], nullptr);

  int status = 0;
  int wait_errno = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { wait_errno = errno; break; }
  }
  restore();

  if (wait_errno != 0) { r.spawn_errno = wait_errno; return r; }
  if (child_errno != 0) { r.spawn_errno = child_errno; return r; }

  r.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  return r;
}

fs::path current_executable(const char* argv0){
  std::error_code ec;
  auto self = fs::read_symlink("/proc/self/exe", ec);
  if (!ec) return self;
  if (argv0 && *argv0) return fs::absolute(argv0, ec);
  return fs::path("ccr");
}

} // namespace ccr
