#include <stackup/app.hpp>
#include <stackup/cli.hpp>
#include <stackup/docker.hpp>
#include <stackup/errors.hpp>
#include <stackup/fingerprint.hpp>
#include <stackup/loader.hpp>
#include <stackup/observer.hpp>
#include <stackup/resources.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#ifndef STACKUP_VERSION
#define STACKUP_VERSION "0.0.0"
#endif
#ifndef STACKUP_COMMIT
#define STACKUP_COMMIT "unknown"
#endif
#ifndef STACKUP_BUILD_TIME
#define STACKUP_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;

namespace stackup {

static void print_help() {
  std::cout <<
      R"(stackup - declarative multi-container runner

Usage:
  stackup [-f FILE] [-p NAME] [-v] up       create or converge the project
  stackup [-f FILE] [-p NAME] [-v] down     remove containers, volumes, networks
  stackup [-f FILE] [-p NAME] [-v] config   print the normalized services
  stackup version
  stackup help

Options:
  -f, --file FILE          configuration file (default: compose.yaml in cwd)
  -p, -n, --project-name NAME
                           project name (default: the file's directory)
  -v, --verbose            debug logging (STACKUP_LOG_LEVEL overrides)

Environment:
  DOCKER_HOST              unix:///var/run/docker.sock or tcp://host:port
  DOCKER_API_VERSION       engine API version, e.g. 1.41
)";
}

static void setup_logging(const GlobalOptions &opts) {
  spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
  if (const char *lvl = std::getenv("STACKUP_LOG_LEVEL"); lvl && *lvl) {
    auto level = spdlog::level::from_str(lvl);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && std::string(lvl) != "off")
      spdlog::warn("STACKUP_LOG_LEVEL: unknown level '{}'", lvl);
    else
      spdlog::set_level(level);
  }
}

static fs::path config_path(const GlobalOptions &opts) {
  if (!opts.file.empty())
    return fs::path(opts.file);
  return find_default_config(fs::current_path());
}

ReconcileReport up(RuntimeClient &rt, const Project &project) {
  spdlog::info("[up] project {}: {} service(s)", project.name,
               project.services.size());
  auto resolved = ResourceResolver(rt).resolve(project);
  auto observed = collect_containers(rt, project.name);
  auto report = Reconciler(rt).reconcile(project, std::move(observed), resolved);
  spdlog::info("[up] project {}: {} created, {} replaced, {} unchanged, "
               "{} orphan service(s) removed",
               project.name, report.created.size(), report.replaced.size(),
               report.kept.size(), report.orphaned.size());
  return report;
}

TeardownReport down(RuntimeClient &rt, const std::string &project) {
  spdlog::info("[down] project {}", project);
  auto report = teardown(rt, project);
  spdlog::info("[down] project {}: removed {} container(s), {} volume(s), "
               "{} network(s)",
               project, report.containers, report.volumes, report.networks);
  return report;
}

static void print_config(const Project &p) {
  std::cout << "project: " << p.name << "\n";
  std::cout << "working_dir: " << p.working_dir.string() << "\n";
  for (const auto &s : p.services) {
    std::cout << "---\n# service " << s.name << "\n";
    std::cout << fingerprint(s) << "\n";
  }
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }
  setup_logging(pr.opts);
  const auto &opts = pr.opts;

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("stackup {} ({}, built {})\n",
                                     STACKUP_VERSION, STACKUP_COMMIT,
                                     STACKUP_BUILD_TIME);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdConfig>) {
            print_config(ConfigLoader::load(config_path(opts), opts.project));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdUp>) {
            auto project = ConfigLoader::load(config_path(opts), opts.project);
            auto rt = DockerClient::from_env();
            up(rt, project);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdDown>) {
            // the file is not parsed: down must work on a broken or
            // deleted configuration
            auto name = opts.project.empty()
                            ? project_name_from_file(config_path(opts))
                            : normalize_project_name(opts.project);
            auto rt = DockerClient::from_env();
            down(rt, name);
            return 0;
          }
        },
        *pr.cmd);
  } catch (const ConfigError &e) {
    spdlog::error("configuration: {}", e.what());
  } catch (const ResourceError &e) {
    spdlog::error("resources: {}", e.what());
  } catch (const RuntimeError &e) {
    spdlog::error("runtime: {}", e.what());
  } catch (const Error &e) {
    spdlog::error("{}", e.what());
  } catch (const fs::filesystem_error &e) {
    spdlog::error("{}", e.what());
  }
  return 1;
}

} // namespace stackup
