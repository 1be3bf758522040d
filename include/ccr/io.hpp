#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace ccr {
namespace io {
  void ensure_dir(const std::filesystem::path& p);
  int  open_devnull();

  void rotate_logs(const std::filesystem::path& base_path,
                   std::uintmax_t max_bytes,
                   int backups);

  bool is_terminal(int fd);
  std::string read_all(int fd);
}
} // namespace ccr
