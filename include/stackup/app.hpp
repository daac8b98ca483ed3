#pragma once
#include "project.hpp"
#include "reconciler.hpp"
#include "runtime.hpp"
#include "teardown.hpp"
#include <string>

namespace stackup {

// resolve shared resources, observe, reconcile
ReconcileReport up(RuntimeClient &rt, const Project &project);

// teardown by project name only; no configuration needed
TeardownReport down(RuntimeClient &rt, const std::string &project);

class App {
public:
  int run(int argc, char **argv);
};

} // namespace stackup
