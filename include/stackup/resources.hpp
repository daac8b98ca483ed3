#pragma once
#include "project.hpp"
#include "runtime.hpp"
#include <filesystem>
#include <map>
#include <string>

namespace stackup {

struct ResolvedResources {
  std::map<std::string, std::string> networks; // logical -> runtime network
  std::map<std::string, std::string> volumes;  // logical -> runtime volume
  std::map<std::string, std::filesystem::path> configs; // -> host file
  std::map<std::string, std::filesystem::path> secrets; // -> host file
};

// Creates the project's missing networks and volumes and locates config and
// secret files. Safe to run on every `up`.
class ResourceResolver {
public:
  explicit ResourceResolver(RuntimeClient &rt) : rt_(rt) {}

  ResolvedResources resolve(const Project &p);

private:
  std::string ensure_network(const Project &p, const std::string &key,
                             const NetworkDef &def);
  std::string ensure_volume(const Project &p, const std::string &key,
                            const VolumeDef &def);

  RuntimeClient &rt_;
};

} // namespace stackup
