#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace ccr {

class IoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Pid record and the advisory session counter. Every call goes to disk.
class ProcessRegistry {
public:
  ProcessRegistry(std::filesystem::path pid_file,
                  std::filesystem::path ref_count_file);

  void write_pid(int pid) const;
  std::optional<int> read_pid() const;
  void clear_pid() const;

  int reference_count() const;
  int increment_reference_count() const;
  int decrement_reference_count() const;
  void clear_reference_count() const;

  const std::filesystem::path &pid_file() const { return pid_file_; }
  const std::filesystem::path &ref_count_file() const {
    return ref_count_file_;
  }

private:
  void write_reference_count(int count) const;

  std::filesystem::path pid_file_;
  std::filesystem::path ref_count_file_;
};

std::optional<int> parse_int(const std::string &s);

} // namespace ccr
