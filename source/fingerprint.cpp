#include <stackup/errors.hpp>
#include <stackup/fingerprint.hpp>

#include <yaml-cpp/yaml.h>

namespace stackup {

static const char *mount_type_name(MountType t) {
  switch (t) {
  case MountType::Bind: return "bind";
  case MountType::Volume: return "volume";
  case MountType::Tmpfs: return "tmpfs";
  }
  return "volume";
}

static void emit_file_refs(YAML::Emitter &out, const char *key,
                           const std::vector<FileRef> &refs) {
  out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
  for (const auto &r : refs) {
    out << YAML::BeginMap;
    out << YAML::Key << "source" << YAML::Value << r.source;
    out << YAML::Key << "target" << YAML::Value << r.target;
    out << YAML::Key << "uid" << YAML::Value << r.uid;
    out << YAML::Key << "gid" << YAML::Value << r.gid;
    out << YAML::Key << "mode" << YAML::Value;
    if (r.mode)
      out << *r.mode;
    else
      out << YAML::Null;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
}

// Every field is written, always in the same order; std::map keeps keys
// sorted, sequences keep declaration order.
std::string fingerprint(const ServiceSpec &s) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << s.name;
  out << YAML::Key << "image" << YAML::Value << s.image;
  out << YAML::Key << "command" << YAML::Value << s.command;
  out << YAML::Key << "entrypoint" << YAML::Value << s.entrypoint;
  out << YAML::Key << "environment" << YAML::Value << s.environment;
  out << YAML::Key << "labels" << YAML::Value << s.labels;

  out << YAML::Key << "mounts" << YAML::Value << YAML::BeginSeq;
  for (const auto &m : s.mounts) {
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << mount_type_name(m.type);
    out << YAML::Key << "source" << YAML::Value << m.source;
    out << YAML::Key << "target" << YAML::Value << m.target;
    out << YAML::Key << "read_only" << YAML::Value << m.read_only;
    out << YAML::Key << "tmpfs_size" << YAML::Value << m.tmpfs_size;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "networks" << YAML::Value << YAML::BeginSeq;
  for (const auto &n : s.networks) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << n.name;
    out << YAML::Key << "aliases" << YAML::Value << n.aliases;
    out << YAML::Key << "ipv4_address" << YAML::Value << n.ipv4_address;
    out << YAML::Key << "ipv6_address" << YAML::Value << n.ipv6_address;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::Key << "network_mode" << YAML::Value << s.network_mode;

  out << YAML::Key << "ports" << YAML::Value << YAML::BeginSeq;
  for (const auto &p : s.ports) {
    out << YAML::BeginMap;
    out << YAML::Key << "target" << YAML::Value << p.target;
    out << YAML::Key << "published" << YAML::Value << p.published;
    out << YAML::Key << "host_ip" << YAML::Value << p.host_ip;
    out << YAML::Key << "protocol" << YAML::Value << p.protocol;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::Key << "expose" << YAML::Value << s.expose;

  out << YAML::Key << "restart" << YAML::Value << s.restart;
  out << YAML::Key << "cap_add" << YAML::Value << s.cap_add;
  out << YAML::Key << "cap_drop" << YAML::Value << s.cap_drop;
  out << YAML::Key << "security_opt" << YAML::Value << s.security_opt;
  out << YAML::Key << "privileged" << YAML::Value << s.privileged;
  out << YAML::Key << "read_only" << YAML::Value << s.read_only;
  out << YAML::Key << "init" << YAML::Value;
  if (s.init)
    out << *s.init;
  else
    out << YAML::Null;
  out << YAML::Key << "user" << YAML::Value << s.user;
  out << YAML::Key << "userns_mode" << YAML::Value << s.userns_mode;
  out << YAML::Key << "pid" << YAML::Value << s.pid;
  out << YAML::Key << "ipc" << YAML::Value << s.ipc;

  out << YAML::Key << "hostname" << YAML::Value << s.hostname;
  out << YAML::Key << "domainname" << YAML::Value << s.domainname;
  out << YAML::Key << "mac_address" << YAML::Value << s.mac_address;
  out << YAML::Key << "working_dir" << YAML::Value << s.working_dir;
  out << YAML::Key << "stop_signal" << YAML::Value << s.stop_signal;
  out << YAML::Key << "tty" << YAML::Value << s.tty;
  out << YAML::Key << "stdin_open" << YAML::Value << s.stdin_open;

  out << YAML::Key << "dns" << YAML::Value << s.dns;
  out << YAML::Key << "dns_search" << YAML::Value << s.dns_search;
  out << YAML::Key << "extra_hosts" << YAML::Value << s.extra_hosts;
  out << YAML::Key << "sysctls" << YAML::Value << s.sysctls;
  out << YAML::Key << "shm_size" << YAML::Value << s.shm_size;

  emit_file_refs(out, "configs", s.configs);
  emit_file_refs(out, "secrets", s.secrets);
  out << YAML::EndMap;

  if (!out.good())
    throw Error("fingerprint: " + out.GetLastError());
  return std::string(out.c_str(), out.size());
}

} // namespace stackup
