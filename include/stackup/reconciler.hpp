#pragma once
#include "observer.hpp"
#include "project.hpp"
#include "resources.hpp"
#include "runtime.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace stackup {

struct ReconcileReport {
  std::vector<std::string> created;  // services that had no container
  std::vector<std::string> replaced; // services whose containers diverged
  std::vector<std::string> kept;
  std::vector<std::string> orphaned; // services removed as orphans
  std::vector<std::string> container_ids; // ids created during the pass
  std::size_t removed = 0;                // containers removed

  bool changed() const { return removed != 0 || !container_ids.empty(); }
};

class Reconciler {
public:
  explicit Reconciler(RuntimeClient &rt) : rt_(rt) {}

  // One convergence pass. Aborts on the first failing runtime call; what was
  // already changed stays changed.
  ReconcileReport reconcile(const Project &project, ObservedState observed,
                            const ResolvedResources &resolved);

private:
  RuntimeClient &rt_;
};

} // namespace stackup
