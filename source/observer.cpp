#include <stackup/labels.hpp>
#include <stackup/observer.hpp>

#include <spdlog/spdlog.h>

namespace stackup {

static std::string display_name(const ContainerSummary &c) {
  if (c.names.empty())
    return c.id.substr(0, 12);
  const auto &n = c.names.front();
  return (!n.empty() && n[0] == '/') ? n.substr(1) : n;
}

ObservedState collect_containers(RuntimeClient &rt, const std::string &project) {
  ObservedState state;
  for (auto &c : rt.list_containers(project)) {
    auto p = c.labels.find(labels::kProject);
    if (p == c.labels.end() || p->second != project)
      continue;

    ObservedContainer o;
    o.id = c.id;
    o.name = display_name(c);
    o.state = c.state;
    if (auto s = c.labels.find(labels::kService); s != c.labels.end())
      o.service = s->second;
    if (auto f = c.labels.find(labels::kConfig); f != c.labels.end())
      o.fingerprint = f->second;
    state[o.service].push_back(std::move(o));
  }
  spdlog::debug("[project={}] observed {} service(s)", project, state.size());
  return state;
}

void remove_containers(RuntimeClient &rt,
                       const std::vector<ObservedContainer> &containers) {
  for (const auto &c : containers) {
    if (c.state != "exited" && c.state != "created" && c.state != "dead") {
      spdlog::info("[service={}] stopping {}", c.service, c.name);
      rt.stop_container(c.id);
    }
    spdlog::info("[service={}] removing {}", c.service, c.name);
    rt.remove_container(c.id);
  }
}

} // namespace stackup
