#include <ccr/io.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace ccr {
namespace io {

void ensure_dir(const fs::path &p) {
  if (!fs::exists(p))
    fs::create_directories(p);
}

static fs::path backup_path(const fs::path &base, int n) {
  fs::path p = base;
  p += "." + std::to_string(n);
  return p;
}

// ccr-server.log -> .1 -> .2 ... ; the oldest backup falls off the end
void rotate_logs(const fs::path &base_path, std::uintmax_t max_bytes,
                 int backups) {
  std::error_code ec;
  auto size = fs::file_size(base_path, ec);
  if (ec || size < max_bytes)
    return;

  if (backups < 1) {
    fs::resize_file(base_path, 0, ec);
    if (ec)
      spdlog::warn("[log] truncate {}: {}", base_path.string(), ec.message());
    return;
  }

  fs::remove(backup_path(base_path, backups), ec);
  for (int n = backups - 1; n >= 1; --n) {
    auto from = backup_path(base_path, n);
    if (!fs::exists(from, ec))
      continue;
    fs::rename(from, backup_path(base_path, n + 1), ec);
    if (ec)
      spdlog::warn("[log] rotate {}: {}", from.string(), ec.message());
  }

  fs::rename(base_path, backup_path(base_path, 1), ec);
  if (ec) {
    spdlog::warn("[log] rotate {}: {}", base_path.string(), ec.message());
    return;
  }
  int fd = ::open(base_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd >= 0)
    ::close(fd);
}

int open_devnull() { return ::open("/dev/null", O_RDWR); }

bool is_terminal(int fd) { return ::isatty(fd) == 1; }

std::string read_all(int fd) {
  std::string s;
  std::array<char, 65536> buf{};
  for (;;) {
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
      s.append(buf.data(), static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      if (n < 0)
        spdlog::debug("[stdin] read: {}", std::strerror(errno));
      break;
    }
  }
  return s;
}

} // namespace io
} // namespace ccr
