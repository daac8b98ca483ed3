#pragma once
#include "service.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace stackup {

struct NetworkDef {
  std::string name; // runtime name
  std::string driver;
  std::map<std::string, std::string> driver_opts;
  std::map<std::string, std::string> labels;
  bool external = false;
  bool internal = false;
  bool attachable = false;
};

struct VolumeDef {
  std::string name; // runtime name
  std::string driver;
  std::map<std::string, std::string> driver_opts;
  std::map<std::string, std::string> labels;
  bool external = false;
};

struct FileDef {
  std::string file; // as declared, relative to the project directory
  bool external = false;
};

struct Project {
  std::string name;
  std::filesystem::path working_dir; // absolute directory of the config file

  std::vector<ServiceSpec> services; // declaration order
  std::map<std::string, NetworkDef> networks;
  std::map<std::string, VolumeDef> volumes;
  std::map<std::string, FileDef> configs;
  std::map<std::string, FileDef> secrets;

  const ServiceSpec *find_service(const std::string &name) const;
};

// "My App.v2" -> "myappv2"; throws ConfigError when nothing usable is left
std::string normalize_project_name(const std::string &raw);

// name of the directory holding the config file, normalized
std::string project_name_from_file(const std::filesystem::path &config_file);

} // namespace stackup
