#pragma once
#include "runtime.hpp"
#include <cstddef>
#include <string>

namespace stackup {

struct TeardownReport {
  std::size_t containers = 0;
  std::size_t volumes = 0;
  std::size_t networks = 0;
};

// containers first, then volumes, then networks
TeardownReport teardown(RuntimeClient &rt, const std::string &project);

} // namespace stackup
