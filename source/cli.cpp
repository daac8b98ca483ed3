#include <stackup/cli.hpp>
#include <string_view>

namespace stackup {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<Command> command_named(std::string_view name) {
  if (name == "up")
    return CmdUp{};
  if (name == "down")
    return CmdDown{};
  if (name == "config")
    return CmdConfig{};
  if (name == "help")
    return CmdHelp{};
  if (name == "version")
    return CmdVersion{};
  return std::nullopt;
}

// Global options may appear before or after the command:
//   stackup -f app.yaml up
//   stackup up -p demo -v
ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  std::optional<std::string> name;

  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "-f" || a == "--file") {
      if (!has_arg(i, argc)) {
        r.error = std::string(a) + ": file path required";
        return r;
      }
      r.opts.file = argv[++i];
    } else if (a == "-p" || a == "-n" || a == "--project-name") {
      if (!has_arg(i, argc)) {
        r.error = std::string(a) + ": project name required";
        return r;
      }
      r.opts.project = argv[++i];
    } else if (a == "-v" || a == "--verbose") {
      r.opts.verbose = true;
    } else if (a == "-h" || a == "--help") {
      r.cmd = CmdHelp{};
      return r;
    } else if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    } else if (!a.empty() && a[0] == '-') {
      r.error = "unknown option: " + std::string(a);
      return r;
    } else if (name) {
      r.error = "unexpected argument: " + std::string(a);
      return r;
    } else {
      name = std::string(a);
    }
  }

  if (!name) {
    r.cmd = CmdHelp{};
    return r;
  }
  r.cmd = command_named(*name);
  if (!r.cmd)
    r.error = "unknown command: " + *name;
  return r;
}

} // namespace stackup
