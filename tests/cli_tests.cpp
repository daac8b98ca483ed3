#include <catch2/catch_all.hpp>
#include <stackup/app.hpp>
#include <stackup/cli.hpp>

#include <string>
#include <vector>

using namespace stackup;

static ParseResult parse(std::vector<std::string> args) {
  std::vector<char*> argv; argv.reserve(args.size()+1);
  for (auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli((int)args.size(), argv.data());
}

static int run_app(std::vector<std::string> args){
  std::vector<char*> argv; argv.reserve(args.size()+1);
  for (auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
  argv.push_back(nullptr);
  return App{}.run((int)args.size(), argv.data());
}

TEST_CASE("No arguments shows help") {
  auto r = parse({"stackup"});
  REQUIRE(r.cmd);
  REQUIRE(std::holds_alternative<CmdHelp>(*r.cmd));
  REQUIRE(r.error.empty());
}

TEST_CASE("Commands are recognised") {
  REQUIRE(std::holds_alternative<CmdUp>(*parse({"stackup", "up"}).cmd));
  REQUIRE(std::holds_alternative<CmdDown>(*parse({"stackup", "down"}).cmd));
  REQUIRE(std::holds_alternative<CmdConfig>(*parse({"stackup", "config"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"stackup", "version"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"stackup", "--version"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"stackup", "help"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"stackup", "up", "-h"}).cmd));
}

TEST_CASE("Global options before and after the command") {
  auto r = parse({"stackup", "-f", "app.yaml", "up", "--project-name", "Shop", "-v"});
  REQUIRE(r.error.empty());
  REQUIRE(std::holds_alternative<CmdUp>(*r.cmd));
  REQUIRE(r.opts.file == "app.yaml");
  REQUIRE(r.opts.project == "Shop");
  REQUIRE(r.opts.verbose);

  auto d = parse({"stackup", "down", "--file", "x.yml", "-p", "demo"});
  REQUIRE(std::holds_alternative<CmdDown>(*d.cmd));
  REQUIRE(d.opts.file == "x.yml");
  REQUIRE(d.opts.project == "demo");
  REQUIRE_FALSE(d.opts.verbose);

  auto n = parse({"stackup", "-n", "shop", "down"});
  REQUIRE(n.error.empty());
  REQUIRE(std::holds_alternative<CmdDown>(*n.cmd));
  REQUIRE(n.opts.project == "shop");
  REQUIRE_FALSE(parse({"stackup", "up", "-n"}).cmd);
}

TEST_CASE("Usage errors") {
  auto unknown = parse({"stackup", "deploy"});
  REQUIRE_FALSE(unknown.cmd);
  REQUIRE(unknown.error == "unknown command: deploy");

  auto flag = parse({"stackup", "up", "--force"});
  REQUIRE_FALSE(flag.cmd);
  REQUIRE(flag.error == "unknown option: --force");

  auto missing = parse({"stackup", "up", "-f"});
  REQUIRE_FALSE(missing.cmd);
  REQUIRE_FALSE(missing.error.empty());

  auto extra = parse({"stackup", "up", "web"});
  REQUIRE_FALSE(extra.cmd);
  REQUIRE(extra.error == "unexpected argument: web");
}

TEST_CASE("App exit codes for help, version and usage errors") {
  REQUIRE(run_app({"stackup", "help"}) == 0);
  REQUIRE(run_app({"stackup", "version"}) == 0);
  REQUIRE(run_app({"stackup", "bogus"}) == 2);
}

TEST_CASE("App reports configuration errors with exit code 1") {
  REQUIRE(run_app({"stackup", "-f", "/nonexistent/stackup/compose.yaml", "config"}) == 1);
}
