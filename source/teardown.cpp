#include <stackup/labels.hpp>
#include <stackup/observer.hpp>
#include <stackup/teardown.hpp>

#include <spdlog/spdlog.h>

namespace stackup {

template <typename T>
static bool owned_by(const T &resource, const std::string &project) {
  auto it = resource.labels.find(labels::kProject);
  return it != resource.labels.end() && it->second == project;
}

TeardownReport teardown(RuntimeClient &rt, const std::string &project) {
  TeardownReport report;

  // consumers first: a network or volume in use cannot be removed
  for (const auto &[service, containers] : collect_containers(rt, project)) {
    remove_containers(rt, containers);
    report.containers += containers.size();
  }

  for (const auto &v : rt.list_volumes(project)) {
    if (!owned_by(v, project))
      continue;
    spdlog::info("[volume={}] removing", v.name);
    rt.remove_volume(v.name);
    ++report.volumes;
  }

  for (const auto &n : rt.list_networks(project)) {
    if (!owned_by(n, project))
      continue;
    spdlog::info("[network={}] removing", n.name);
    rt.remove_network(n.id.empty() ? n.name : n.id);
    ++report.networks;
  }
  return report;
}

} // namespace stackup
