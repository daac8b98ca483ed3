#include <stackup/fingerprint.hpp>
#include <stackup/materializer.hpp>
#include <stackup/reconciler.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace stackup {

ReconcileReport Reconciler::reconcile(const Project &project,
                                      ObservedState observed,
                                      const ResolvedResources &resolved) {
  ReconcileReport report;
  Materializer materializer(rt_, project, resolved);

  for (const auto &s : project.services) {
    std::vector<ObservedContainer> containers;
    if (auto it = observed.find(s.name); it != observed.end()) {
      containers = std::move(it->second);
      observed.erase(it);
    }

    if (containers.empty()) {
      report.container_ids.push_back(materializer.materialize(s));
      report.created.push_back(s.name);
      continue;
    }

    const auto expected = fingerprint(s);
    const bool diverged =
        std::any_of(containers.begin(), containers.end(),
                    [&](const ObservedContainer &c) {
                      return !c.fingerprint || *c.fingerprint != expected;
                    });
    if (!diverged) {
      spdlog::info("[service={}] up to date ({} container(s))", s.name,
                   containers.size());
      report.kept.push_back(s.name);
      continue;
    }

    // whole-service replace, never a partial one
    spdlog::info("[service={}] configuration changed, recreating", s.name);
    remove_containers(rt_, containers);
    report.removed += containers.size();
    report.container_ids.push_back(materializer.materialize(s));
    report.replaced.push_back(s.name);
  }

  // whatever is left has no service in the configuration any more
  for (const auto &[service, containers] : observed) {
    spdlog::info("[service={}] not in configuration, removing {} orphan(s)",
                 service.empty() ? "<unlabelled>" : service, containers.size());
    remove_containers(rt_, containers);
    report.removed += containers.size();
    report.orphaned.push_back(service);
  }
  return report;
}

} // namespace stackup
