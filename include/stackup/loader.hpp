#pragma once
#include "interpolate.hpp"
#include "project.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace stackup {

class ConfigLoader {
public:
  // Reads, interpolates and normalizes the file. project_name overrides the
  // name of the file's directory.
  static Project load(const std::filesystem::path &file,
                      const std::string &project_name = {});

  static Project load_string(const std::string &yaml,
                             const std::filesystem::path &working_dir,
                             const std::string &project_name,
                             const Environment &env);
};

// shell-like word split honouring quotes and backslash escapes
std::vector<std::string> split_command(const std::string &s);

// compose.yaml, compose.yml, docker-compose.yml, docker-compose.yaml in dir
std::filesystem::path find_default_config(const std::filesystem::path &dir);

} // namespace stackup
