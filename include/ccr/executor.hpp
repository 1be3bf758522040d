#pragma once
#include <ccr/config.hpp>
#include <ccr/sniff.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace ccr {

// Where a dispatched command ends up once the service is reachable.
class CommandExecutor {
public:
  virtual ~CommandExecutor() = default;

  virtual int run_code(const std::vector<std::string> &args) = 0;
  virtual int describe_image(const SniffedPayload &payload) = 0;
};

class ClaudeExecutor : public CommandExecutor {
public:
  explicit ClaudeExecutor(Config cfg, std::ostream &out = std::cout,
                          std::ostream &err = std::cerr);

  int run_code(const std::vector<std::string> &args) override;
  int describe_image(const SniffedPayload &payload) override;

private:
  Config cfg_;
  std::ostream &out_;
  std::ostream &err_;
};

} // namespace ccr
