#include <stackup/errors.hpp>
#include <stackup/fingerprint.hpp>
#include <stackup/labels.hpp>
#include <stackup/materializer.hpp>
#include <stackup/units.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

namespace stackup {

RestartPolicySpec parse_restart_policy(const std::string &v) {
  RestartPolicySpec p;
  if (v.empty() || v == "no")
    return p;
  if (v == "always" || v == "unless-stopped") {
    p.name = v;
    return p;
  }
  if (v.rfind("on-failure", 0) == 0) {
    p.name = "on-failure";
    auto rest = v.substr(10);
    if (rest.empty())
      return p;
    auto count = rest.substr(1);
    if (rest[0] == ':' && !count.empty() && count.size() < 10 &&
        std::all_of(count.begin(), count.end(),
                    [](char c) { return std::isdigit((unsigned char)c); })) {
      p.maximum_retry_count = std::stoi(count);
      return p;
    }
  }
  throw ConfigError("unknown restart policy '" + v + "'");
}

static std::string short_id(const std::string &id) { return id.substr(0, 12); }

static const NetworkAttachment &primary_attachment(const ServiceSpec &s) {
  static const NetworkAttachment kDefault{"default", {}, {}, {}};
  return s.networks.empty() ? kDefault : s.networks.front();
}

// service name is always an alias so peers can reach it by name
static EndpointSettings endpoint_for(const ServiceSpec &s,
                                     const NetworkAttachment &a) {
  EndpointSettings ep;
  ep.aliases.push_back(s.name);
  for (const auto &alias : a.aliases)
    if (alias != s.name)
      ep.aliases.push_back(alias);
  ep.ipv4_address = a.ipv4_address;
  ep.ipv6_address = a.ipv6_address;
  return ep;
}

std::string Materializer::resolve_network(const std::string &logical) const {
  auto it = resolved_.networks.find(logical);
  if (it == resolved_.networks.end())
    throw ResourceError(fmt::format("network {} was not resolved", logical));
  return it->second;
}

std::string Materializer::network_mode(const ServiceSpec &s) const {
  if (!s.network_mode.empty()) {
    if (s.network_mode.rfind("service:", 0) == 0)
      return fmt::format("container:{}_{}_1", project_.name,
                         s.network_mode.substr(8));
    return s.network_mode;
  }
  return resolve_network(primary_attachment(s).name);
}

std::vector<MountRequest>
Materializer::service_mounts(const ServiceSpec &s) const {
  std::vector<MountRequest> out;
  for (const auto &m : s.mounts) {
    MountRequest r;
    r.target = m.target;
    r.read_only = m.read_only;
    switch (m.type) {
    case MountType::Bind: {
      r.type = "bind";
      fs::path src = m.source;
      if (m.source == "~" || m.source.rfind("~/", 0) == 0) {
        const char *home = ::getenv("HOME");
        src = fs::path(home ? home : "/") / m.source.substr(std::min<size_t>(2, m.source.size()));
      } else if (src.is_relative()) {
        src = project_.working_dir / src;
      }
      r.source = src.lexically_normal().string();
      break;
    }
    case MountType::Volume: {
      r.type = "volume";
      if (!m.source.empty()) {
        auto it = resolved_.volumes.find(m.source);
        if (it == resolved_.volumes.end())
          throw ResourceError(fmt::format("volume {} was not resolved", m.source));
        r.source = it->second;
      }
      break;
    }
    case MountType::Tmpfs: {
      r.type = "tmpfs";
      if (!m.tmpfs_size.empty()) {
        auto size = parse_ram_size(m.tmpfs_size);
        if (!size)
          throw ConfigError(fmt::format("service {}: invalid tmpfs size '{}'",
                                        s.name, m.tmpfs_size));
        r.tmpfs_size_bytes = *size;
      }
      break;
    }
    }
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<MountRequest> Materializer::file_mounts(const ServiceSpec &s) const {
  std::vector<MountRequest> out;
  auto add = [&](const FileRef &ref, const std::map<std::string, fs::path> &files,
                 const char *kind, const std::string &target) {
    auto it = files.find(ref.source);
    if (it == files.end())
      throw ResourceError(fmt::format("{} {} was not resolved", kind, ref.source));
    if (!ref.uid.empty() || !ref.gid.empty() || ref.mode)
      spdlog::debug("[service={}] uid/gid/mode of {} {} are not applied to bind mounts",
                    s.name, kind, ref.source);
    out.push_back(MountRequest{"bind", it->second.string(), target, true, 0});
  };

  for (const auto &c : s.configs)
    add(c, resolved_.configs, "config",
        c.target.empty() ? "/" + c.source : c.target);
  for (const auto &c : s.secrets) {
    std::string target = c.target.empty() ? c.source : c.target;
    if (target[0] != '/')
      target = "/run/secrets/" + target;
    add(c, resolved_.secrets, "secret", target);
  }
  return out;
}

ContainerCreateRequest Materializer::build_request(const ServiceSpec &s) const {
  ContainerCreateRequest req;
  req.name = fmt::format("{}_{}_1", project_.name, s.name);

  req.image = s.image;
  req.cmd = s.command;
  req.entrypoint = s.entrypoint;
  for (const auto &[k, v] : s.environment)
    req.env.push_back(k + "=" + v);

  req.labels = s.labels;
  req.labels[labels::kProject] = project_.name;
  req.labels[labels::kService] = s.name;
  req.labels[labels::kConfig] = fingerprint(s);

  req.hostname = s.hostname;
  req.domainname = s.domainname;
  req.user = s.user;
  req.working_dir = s.working_dir;
  req.stop_signal = s.stop_signal;
  req.mac_address = s.mac_address;
  req.tty = s.tty;
  req.open_stdin = s.stdin_open;

  req.network_mode = network_mode(s);
  req.restart_policy = parse_restart_policy(s.restart);
  req.cap_add = s.cap_add;
  req.cap_drop = s.cap_drop;
  req.security_opt = s.security_opt;
  req.dns = s.dns;
  req.dns_search = s.dns_search;
  req.extra_hosts = s.extra_hosts;
  req.sysctls = s.sysctls;
  req.ipc_mode = s.ipc;
  req.pid_mode = s.pid;
  req.userns_mode = s.userns_mode;
  req.privileged = s.privileged;
  req.readonly_rootfs = s.read_only;
  req.init = s.init;

  if (!s.shm_size.empty()) {
    auto size = parse_ram_size(s.shm_size);
    if (!size)
      throw ConfigError(fmt::format("service {}: invalid shm_size '{}'", s.name,
                                    s.shm_size));
    req.shm_size = *size;
  }

  req.mounts = service_mounts(s);
  auto files = file_mounts(s);
  req.mounts.insert(req.mounts.end(), files.begin(), files.end());

  for (const auto &e : s.expose)
    req.exposed_ports.insert(e.find('/') == std::string::npos ? e + "/tcp" : e);
  for (const auto &p : s.ports) {
    auto key = fmt::format("{}/{}", p.target, p.protocol);
    req.exposed_ports.insert(key);
    req.port_bindings[key].push_back(PortBinding{p.host_ip, p.published});
  }

  if (s.network_mode.empty()) {
    const auto &primary = primary_attachment(s);
    req.endpoint = std::make_pair(resolve_network(primary.name),
                                  endpoint_for(s, primary));
  }
  return req;
}

std::string Materializer::materialize(const ServiceSpec &s) {
  auto req = build_request(s);

  // extra networks are resolved up front so a missing one fails before create
  std::vector<std::pair<std::string, EndpointSettings>> extra;
  if (s.network_mode.empty()) {
    for (size_t i = 1; i < s.networks.size(); ++i)
      extra.emplace_back(resolve_network(s.networks[i].name),
                         endpoint_for(s, s.networks[i]));
  }

  spdlog::info("[service={}] creating container {} ({})", s.name, req.name,
               s.image);
  const auto id = rt_.create_container(req);
  for (const auto &[net, ep] : extra) {
    spdlog::debug("[service={}] connecting {} to {}", s.name, short_id(id), net);
    rt_.connect_network(id, net, ep);
  }
  rt_.start_container(id);
  spdlog::info("[service={}] started {}", s.name, short_id(id));
  return id;
}

} // namespace stackup
