#include <ccr/state.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ccr {

std::optional<int> parse_int(const std::string& s){
  auto b = s.data();
  auto e = s.data() + s.size();
  while (b<e && (*b==' '||*b=='\t'||*b=='\n'||*b=='\r')) ++b;
  while (e>b && (e[-1]==' '||e[-1]=='\t'||e[-1]=='\n'||e[-1]=='\r')) --e;
  if (b==e) return std::nullopt;
  int v=0;
  auto [ptr, ec] = std::from_chars(b, e, v);
  if (ec != std::errc() || ptr != e) return std::nullopt;
  return v;
}

static std::optional<std::string> slurp(const fs::path& f){
  std::ifstream in(f); if(!in) return std::nullopt;
  std::stringstream ss; ss << in.rdbuf();
  return ss.str();
}

static void ensure_parent_dir(const fs::path& f){
  auto p = f.parent_path();
  if (!p.empty() && !fs::exists(p)) fs::create_directories(p);
}

ProcessRegistry::ProcessRegistry(fs::path pid_file, fs::path ref_count_file)
  : pid_file_(std::move(pid_file)), ref_count_file_(std::move(ref_count_file)) {}

// readers see either the old record or the new one, never a partial write
void ProcessRegistry::write_pid(int pid) const {
  try {
    ensure_parent_dir(pid_file_);
  } catch (const fs::filesystem_error& e) {
    throw IoError("pid file: " + std::string(e.what()));
  }
  fs::path tmp = pid_file_;
  tmp += ".tmp";
  {
    std::ofstream o(tmp, std::ios::trunc);
    if (!o) throw IoError("pid file: cannot open " + tmp.string());
    o << pid;
    o.close();
    if (!o) throw IoError("pid file: write failed " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, pid_file_, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw IoError("pid file: rename to " + pid_file_.string() + " failed");
  }
}

std::optional<int> ProcessRegistry::read_pid() const {
  auto content = slurp(pid_file_);
  if (!content) return std::nullopt;
  auto pid = parse_int(*content);
  if (!pid || *pid <= 0) {
    spdlog::debug("pid file {} is malformed, treating as absent", pid_file_.string());
    return std::nullopt;
  }
  return pid;
}

void ProcessRegistry::clear_pid() const {
  std::error_code ec;
  fs::remove(pid_file_, ec);
  if (ec) spdlog::debug("pid file {} not removed: {}", pid_file_.string(), ec.message());
}

int ProcessRegistry::reference_count() const {
  auto content = slurp(ref_count_file_);
  if (!content) return 0;
  auto v = parse_int(*content);
  return v ? std::max(0, *v) : 0;
}

void ProcessRegistry::write_reference_count(int count) const {
  std::error_code ec;
  auto p = ref_count_file_.parent_path();
  if (!p.empty()) fs::create_directories(p, ec);
  std::ofstream o(ref_count_file_, std::ios::trunc);
  if (o) o << count;
  if (!o) spdlog::warn("reference count {} not written", ref_count_file_.string());
}

int ProcessRegistry::increment_reference_count() const {
  int count = reference_count() + 1;
  write_reference_count(count);
  return count;
}

int ProcessRegistry::decrement_reference_count() const {
  int count = std::max(0, reference_count() - 1);
  write_reference_count(count);
  return count;
}

void ProcessRegistry::clear_reference_count() const {
  std::error_code ec;
  fs::remove(ref_count_file_, ec);
  if (ec) spdlog::debug("reference count {} not removed: {}", ref_count_file_.string(), ec.message());
}

} // namespace ccr
