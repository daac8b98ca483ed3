#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stackup {

struct ContainerSummary {
  std::string id;
  std::vector<std::string> names;
  std::string state; // running, exited, created, ...
  std::map<std::string, std::string> labels;
};

struct MountRequest {
  std::string type; // bind, volume, tmpfs
  std::string source;
  std::string target;
  bool read_only = false;
  std::int64_t tmpfs_size_bytes = 0;
};

struct PortBinding {
  std::string host_ip;
  std::string host_port;
};

struct EndpointSettings {
  std::vector<std::string> aliases;
  std::string ipv4_address;
  std::string ipv6_address;
};

struct RestartPolicySpec {
  std::string name = "no";
  int maximum_retry_count = 0;
};

struct ContainerCreateRequest {
  std::string name;

  std::string image;
  std::vector<std::string> cmd;
  std::vector<std::string> entrypoint;
  std::vector<std::string> env; // KEY=VALUE
  std::map<std::string, std::string> labels;
  std::set<std::string> exposed_ports; // "80/tcp"
  std::string hostname;
  std::string domainname;
  std::string user;
  std::string working_dir;
  std::string stop_signal;
  std::string mac_address;
  bool tty = false;
  bool open_stdin = false;

  std::string network_mode;
  RestartPolicySpec restart_policy;
  std::vector<MountRequest> mounts;
  std::map<std::string, std::vector<PortBinding>> port_bindings;
  std::vector<std::string> cap_add;
  std::vector<std::string> cap_drop;
  std::vector<std::string> security_opt;
  std::vector<std::string> dns;
  std::vector<std::string> dns_search;
  std::vector<std::string> extra_hosts;
  std::map<std::string, std::string> sysctls;
  std::string ipc_mode;
  std::string pid_mode;
  std::string userns_mode;
  bool privileged = false;
  bool readonly_rootfs = false;
  std::optional<bool> init;
  std::int64_t shm_size = 0;

  // endpoint on the primary network, keyed by the runtime network name
  std::optional<std::pair<std::string, EndpointSettings>> endpoint;
};

struct NetworkSummary {
  std::string id;
  std::string name;
  std::map<std::string, std::string> labels;
};

struct NetworkCreateRequest {
  std::string name;
  std::string driver;
  std::map<std::string, std::string> options;
  std::map<std::string, std::string> labels;
  bool internal = false;
  bool attachable = false;
};

struct VolumeSummary {
  std::string name;
  std::string driver;
  std::map<std::string, std::string> labels;
};

struct VolumeCreateRequest {
  std::string name;
  std::string driver;
  std::map<std::string, std::string> driver_opts;
  std::map<std::string, std::string> labels;
};

// Blocking primitives of the container runtime. Every failure throws
// RuntimeError; "not found" on find_* is reported as std::nullopt.
class RuntimeClient {
public:
  virtual ~RuntimeClient() = default;

  // all containers (running or not) labelled with the project
  virtual std::vector<ContainerSummary>
  list_containers(const std::string &project) = 0;
  virtual std::string create_container(const ContainerCreateRequest &req) = 0;
  virtual void start_container(const std::string &id) = 0;
  virtual void stop_container(const std::string &id) = 0;
  virtual void remove_container(const std::string &id) = 0;
  virtual void connect_network(const std::string &container_id,
                               const std::string &network,
                               const EndpointSettings &endpoint) = 0;

  virtual std::optional<NetworkSummary>
  find_network(const std::string &name) = 0;
  virtual std::string create_network(const NetworkCreateRequest &req) = 0;
  virtual std::vector<NetworkSummary>
  list_networks(const std::string &project) = 0;
  virtual void remove_network(const std::string &id) = 0;

  virtual std::optional<VolumeSummary> find_volume(const std::string &name) = 0;
  virtual std::string create_volume(const VolumeCreateRequest &req) = 0;
  virtual std::vector<VolumeSummary>
  list_volumes(const std::string &project) = 0;
  virtual void remove_volume(const std::string &name) = 0;
};

} // namespace stackup
