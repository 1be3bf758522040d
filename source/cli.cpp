#include <ccr/cli.hpp>
#include <string_view>

namespace ccr {

static bool eq(std::string_view a, std::string_view b) { return a == b; }

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    return r;
  }

  std::string cmd = argv[1];
  if (eq(cmd, "-h") || eq(cmd, "--help") || eq(cmd, "help")) {
    r.cmd = CmdHelp{};
    return r;
  }
  if (eq(cmd, "-v") || eq(cmd, "--version") || eq(cmd, "version")) {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "start") {
    r.cmd = CmdStart{};
    return r;
  }
  if (cmd == "stop") {
    r.cmd = CmdStop{};
    return r;
  }
  if (cmd == "status") {
    CmdStatus c{};
    for (int k = 2; k < argc; k++) {
      std::string_view a = argv[k];
      if (a == "--json")
        c.json = true;
      else {
        r.error = "status: unexpected argument " + std::string(a);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "code") {
    // everything after "code" belongs to the client untouched
    CmdCode c{};
    for (int k = 2; k < argc; k++)
      c.args.emplace_back(argv[k]);
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace ccr
