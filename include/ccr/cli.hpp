#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ccr {

struct CmdStart {};
struct CmdStop {};
struct CmdStatus {
  bool json = false;
};
struct CmdCode {
  std::vector<std::string> args;
};
struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdStart, CmdStop, CmdStatus, CmdCode, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace ccr
