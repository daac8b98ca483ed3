#pragma once
#include "project.hpp"
#include "resources.hpp"
#include "runtime.hpp"
#include <string>
#include <vector>

namespace stackup {

// "no", "always", "unless-stopped", "on-failure[:N]"; throws ConfigError
RestartPolicySpec parse_restart_policy(const std::string &v);

class Materializer {
public:
  Materializer(RuntimeClient &rt, const Project &project,
               const ResolvedResources &resolved)
      : rt_(rt), project_(project), resolved_(resolved) {}

  ContainerCreateRequest build_request(const ServiceSpec &s) const;

  // create -> connect extra networks -> start; returns the container id
  std::string materialize(const ServiceSpec &s);

private:
  std::string network_mode(const ServiceSpec &s) const;
  std::vector<MountRequest> service_mounts(const ServiceSpec &s) const;
  std::vector<MountRequest> file_mounts(const ServiceSpec &s) const;
  std::string resolve_network(const std::string &logical) const;

  RuntimeClient &rt_;
  const Project &project_;
  const ResolvedResources &resolved_;
};

} // namespace stackup
