#pragma once
#include <optional>
#include <string>
#include <variant>

namespace stackup {

struct GlobalOptions {
  std::string file;    // empty: look for compose.yaml & co in cwd
  std::string project; // empty: directory name of the config file
  bool verbose = false;
};

struct CmdUp {};
struct CmdDown {};
struct CmdConfig {};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdUp, CmdDown, CmdConfig, CmdHelp, CmdVersion>;

struct ParseResult {
  GlobalOptions opts;
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace stackup
