#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

enum class MountType { Bind, Volume, Tmpfs };

struct Mount {
  MountType type = MountType::Volume;
  std::string source; // host path (bind), logical volume name, or empty
  std::string target;
  bool read_only = false;
  std::string tmpfs_size; // human size, tmpfs only
};

struct NetworkAttachment {
  std::string name; // logical network name
  std::vector<std::string> aliases;
  std::string ipv4_address;
  std::string ipv6_address;
};

struct PortSpec {
  int target = 0;
  std::string published; // empty: not published
  std::string host_ip;
  std::string protocol = "tcp";
};

// service-level reference to a top-level config or secret
struct FileRef {
  std::string source;
  std::string target;
  std::string uid;
  std::string gid;
  std::optional<std::uint32_t> mode;
};

struct ServiceSpec {
  std::string name;
  std::string image;

  std::vector<std::string> command;
  std::vector<std::string> entrypoint;
  std::map<std::string, std::string> environment;
  std::map<std::string, std::string> labels;

  std::vector<Mount> mounts;
  std::vector<NetworkAttachment> networks; // declaration order
  std::string network_mode;
  std::vector<PortSpec> ports;
  std::vector<std::string> expose;

  std::string restart;

  std::vector<std::string> cap_add;
  std::vector<std::string> cap_drop;
  std::vector<std::string> security_opt;
  bool privileged = false;
  bool read_only = false;
  std::optional<bool> init;
  std::string user;
  std::string userns_mode;
  std::string pid;
  std::string ipc;

  std::string hostname;
  std::string domainname;
  std::string mac_address;
  std::string working_dir;
  std::string stop_signal;
  bool tty = false;
  bool stdin_open = false;

  std::vector<std::string> dns;
  std::vector<std::string> dns_search;
  std::vector<std::string> extra_hosts;
  std::map<std::string, std::string> sysctls;
  std::string shm_size;

  std::vector<FileRef> configs;
  std::vector<FileRef> secrets;
};

} // namespace stackup
