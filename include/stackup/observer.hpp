#pragma once
#include "runtime.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

struct ObservedContainer {
  std::string id;
  std::string name;
  std::string service;
  std::optional<std::string> fingerprint;
  std::string state;
};

// service name -> containers carrying that service label
using ObservedState = std::map<std::string, std::vector<ObservedContainer>>;

ObservedState collect_containers(RuntimeClient &rt, const std::string &project);

// stop (when still up) then remove each container, in order
void remove_containers(RuntimeClient &rt,
                       const std::vector<ObservedContainer> &containers);

} // namespace stackup
