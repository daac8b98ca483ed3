#include <stackup/errors.hpp>
#include <stackup/loader.hpp>
#include <stackup/materializer.hpp>
#include <stackup/units.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace stackup {

namespace {

struct LoadContext {
  fs::path working_dir;
  const Environment &env;
  std::string project;
};

const std::set<std::string> kRootKeys = {"version", "name",    "services",
                                         "networks", "volumes", "configs",
                                         "secrets"};

const std::set<std::string> kServiceKeys = {
    "image",       "command",      "entrypoint",  "environment", "env_file",
    "labels",      "volumes",      "tmpfs",       "networks",    "network_mode",
    "ports",       "expose",       "restart",     "cap_add",     "cap_drop",
    "security_opt", "privileged",  "read_only",   "init",        "user",
    "userns_mode", "pid",          "ipc",         "hostname",    "domainname",
    "mac_address", "working_dir",  "stop_signal", "tty",         "stdin_open",
    "dns",         "dns_search",   "extra_hosts", "sysctls",     "shm_size",
    "configs",     "secrets",      "depends_on"};

} // namespace

static bool defined(const YAML::Node &n) { return n && !n.IsNull(); }

static void warn_unknown_keys(const YAML::Node &map,
                              const std::set<std::string> &known,
                              const std::string &ctx) {
  for (const auto &kv : map) {
    const auto key = kv.first.as<std::string>();
    if (!known.count(key))
      spdlog::warn("[{}] ignoring unsupported key '{}'", ctx, key);
  }
}

static void interpolate_tree(YAML::Node node, const Environment &env) {
  switch (node.Type()) {
  case YAML::NodeType::Scalar:
    if (node.Scalar().find('$') != std::string::npos)
      node = interpolate(node.Scalar(), env);
    break;
  case YAML::NodeType::Sequence:
    for (YAML::Node child : node)
      interpolate_tree(child, env);
    break;
  case YAML::NodeType::Map:
    for (auto kv : node)
      interpolate_tree(kv.second, env);
    break;
  default:
    break;
  }
}

static std::string scalar(const YAML::Node &n, const std::string &what) {
  if (!n.IsScalar())
    throw ConfigError(what + ": expected a scalar value");
  return n.Scalar();
}

static bool boolean(const YAML::Node &n, const std::string &what) {
  try {
    return n.as<bool>();
  } catch (const YAML::BadConversion &) {
    throw ConfigError(what + ": expected a boolean");
  }
}

static std::vector<std::string> string_list(const YAML::Node &n,
                                            const std::string &what) {
  std::vector<std::string> out;
  if (!defined(n))
    return out;
  if (n.IsScalar()) {
    out.push_back(n.Scalar());
    return out;
  }
  if (!n.IsSequence())
    throw ConfigError(what + ": expected a string or a list");
  for (const auto &item : n)
    out.push_back(scalar(item, what));
  return out;
}

// map form or KEY=VALUE list form. A key without value inherits from
// `inherit` when given (and is dropped when unset there), else maps to "".
static std::map<std::string, std::string>
string_map(const YAML::Node &n, const std::string &what,
           const Environment *inherit = nullptr) {
  std::map<std::string, std::string> out;
  auto put = [&](const std::string &k, const std::optional<std::string> &v) {
    if (k.empty())
      throw ConfigError(what + ": empty key");
    if (v) {
      out[k] = *v;
    } else if (!inherit) {
      out[k] = "";
    } else if (auto it = inherit->find(k); it != inherit->end()) {
      out[k] = it->second;
    }
  };

  if (!defined(n))
    return out;
  if (n.IsMap()) {
    for (const auto &kv : n) {
      auto k = scalar(kv.first, what);
      if (kv.second.IsNull())
        put(k, std::nullopt);
      else
        put(k, scalar(kv.second, what + "." + k));
    }
  } else if (n.IsSequence()) {
    for (const auto &item : n) {
      auto s = scalar(item, what);
      auto pos = s.find('=');
      if (pos == std::string::npos)
        put(s, std::nullopt);
      else
        put(s.substr(0, pos), s.substr(pos + 1));
    }
  } else {
    throw ConfigError(what + ": expected a map or a list");
  }
  return out;
}

static std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string one;
  while (std::getline(ss, one, sep))
    out.push_back(one);
  if (!s.empty() && s.back() == sep)
    out.emplace_back();
  return out;
}

std::vector<std::string> split_command(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  bool in_single = false, in_double = false, esc = false, have = false;
  for (char c : s) {
    if (esc) {
      cur.push_back(c);
      esc = false;
      continue;
    }
    if (c == '\\' && !in_single) {
      esc = true;
      have = true;
      continue;
    }
    if (c == '\'' && !in_double) {
      in_single = !in_single;
      have = true;
      continue;
    }
    if (c == '"' && !in_single) {
      in_double = !in_double;
      have = true;
      continue;
    }
    if (!in_single && !in_double && (c == ' ' || c == '\t' || c == '\n')) {
      if (have) {
        out.push_back(cur);
        cur.clear();
        have = false;
      }
      continue;
    }
    cur.push_back(c);
    have = true;
  }
  if (in_single || in_double)
    throw ConfigError("unterminated quote in command: " + s);
  if (have)
    out.push_back(cur);
  return out;
}

static std::vector<std::string> command_list(const YAML::Node &n,
                                             const std::string &what) {
  if (!defined(n))
    return {};
  if (n.IsScalar())
    return split_command(n.Scalar());
  return string_list(n, what);
}

static bool looks_like_path(const std::string &s) {
  return !s.empty() && (s[0] == '/' || s[0] == '.' || s[0] == '~');
}

static int port_number(const std::string &s, const std::string &what) {
  if (s.find('-') != std::string::npos)
    throw ConfigError(what + ": port ranges are not supported");
  if (s.empty() || s.size() > 5 ||
      !std::all_of(s.begin(), s.end(),
                   [](char c) { return std::isdigit((unsigned char)c); }))
    throw ConfigError(what + ": invalid port '" + s + "'");
  int v = std::stoi(s);
  if (v < 1 || v > 65535)
    throw ConfigError(what + ": port out of range '" + s + "'");
  return v;
}

static void check_protocol(const std::string &proto, const std::string &what) {
  if (proto != "tcp" && proto != "udp" && proto != "sctp")
    throw ConfigError(what + ": unknown protocol '" + proto + "'");
}

static PortSpec parse_port(const YAML::Node &n, const std::string &what) {
  PortSpec p;
  if (n.IsMap()) {
    if (!defined(n["target"]))
      throw ConfigError(what + ": target is required");
    p.target = port_number(scalar(n["target"], what), what);
    if (defined(n["published"])) {
      p.published = scalar(n["published"], what);
      port_number(p.published, what);
    }
    if (defined(n["host_ip"]))
      p.host_ip = scalar(n["host_ip"], what);
    if (defined(n["protocol"]))
      p.protocol = scalar(n["protocol"], what);
    check_protocol(p.protocol, what);
    return p;
  }

  // [[HOST_IP:]PUBLISHED:]TARGET[/PROTOCOL]
  std::string spec = scalar(n, what);
  if (auto slash = spec.find('/'); slash != std::string::npos) {
    p.protocol = spec.substr(slash + 1);
    spec = spec.substr(0, slash);
  }
  check_protocol(p.protocol, what);
  auto parts = split(spec, ':');
  std::string target;
  switch (parts.size()) {
  case 1:
    target = parts[0];
    break;
  case 2:
    p.published = parts[0];
    target = parts[1];
    break;
  case 3:
    p.host_ip = parts[0];
    p.published = parts[1];
    target = parts[2];
    break;
  default:
    throw ConfigError(what + ": invalid port '" + spec + "'");
  }
  p.target = port_number(target, what);
  if (!p.published.empty())
    port_number(p.published, what);
  return p;
}

static std::string tmpfs_size_option(const std::string &opts,
                                     const std::string &what) {
  for (const auto &o : split(opts, ',')) {
    if (o.rfind("size=", 0) == 0) {
      auto size = o.substr(5);
      if (!parse_ram_size(size))
        throw ConfigError(what + ": invalid tmpfs size '" + size + "'");
      return size;
    }
  }
  return {};
}

static Mount parse_volume(const YAML::Node &n, const std::string &what) {
  Mount m;
  if (n.IsMap()) {
    std::string type = defined(n["type"]) ? scalar(n["type"], what) : "volume";
    if (type == "bind")
      m.type = MountType::Bind;
    else if (type == "volume")
      m.type = MountType::Volume;
    else if (type == "tmpfs")
      m.type = MountType::Tmpfs;
    else
      throw ConfigError(what + ": unsupported mount type '" + type + "'");
    if (defined(n["source"]))
      m.source = scalar(n["source"], what);
    if (defined(n["target"]))
      m.target = scalar(n["target"], what);
    if (defined(n["read_only"]))
      m.read_only = boolean(n["read_only"], what + ".read_only");
    if (const auto &t = n["tmpfs"]; defined(t) && defined(t["size"])) {
      m.tmpfs_size = scalar(t["size"], what + ".tmpfs.size");
      if (!parse_ram_size(m.tmpfs_size))
        throw ConfigError(what + ": invalid tmpfs size '" + m.tmpfs_size + "'");
    }
    if (m.type == MountType::Bind && m.source.empty())
      throw ConfigError(what + ": bind mount requires a source");
    if (m.type == MountType::Tmpfs && !m.source.empty())
      throw ConfigError(what + ": tmpfs mount cannot have a source");
  } else {
    // [SOURCE:]TARGET[:MODE]
    auto parts = split(scalar(n, what), ':');
    if (parts.size() == 1) {
      m.target = parts[0];
    } else if (parts.size() == 2 || parts.size() == 3) {
      m.source = parts[0];
      m.target = parts[1];
      if (parts.size() == 3) {
        for (const auto &opt : split(parts[2], ',')) {
          if (opt == "ro")
            m.read_only = true;
          else if (opt != "rw")
            spdlog::debug("[{}] ignoring mount option '{}'", what, opt);
        }
      }
    } else {
      throw ConfigError(what + ": invalid volume '" + n.Scalar() + "'");
    }
    m.type = looks_like_path(m.source) ? MountType::Bind : MountType::Volume;
  }
  if (m.target.empty() || m.target[0] != '/')
    throw ConfigError(what + ": mount target must be an absolute path");
  return m;
}

static std::optional<std::uint32_t> file_mode(const std::string &s,
                                              const std::string &what) {
  try {
    std::string digits = s;
    int base = 10;
    if (s.rfind("0o", 0) == 0) {
      digits = s.substr(2);
      base = 8;
    } else if (s.size() > 1 && s[0] == '0') {
      base = 8;
    }
    size_t used = 0;
    unsigned long v = std::stoul(digits, &used, base);
    if (used != digits.size())
      throw ConfigError(what + ": invalid mode '" + s + "'");
    return static_cast<std::uint32_t>(v);
  } catch (const std::logic_error &) {
    throw ConfigError(what + ": invalid mode '" + s + "'");
  }
}

static std::vector<FileRef> parse_file_refs(const YAML::Node &n,
                                            const std::string &what) {
  std::vector<FileRef> out;
  if (!defined(n))
    return out;
  if (!n.IsSequence())
    throw ConfigError(what + ": expected a list");
  for (const auto &item : n) {
    FileRef r;
    if (item.IsScalar()) {
      r.source = item.Scalar();
    } else if (item.IsMap()) {
      if (!defined(item["source"]))
        throw ConfigError(what + ": source is required");
      r.source = scalar(item["source"], what);
      if (defined(item["target"]))
        r.target = scalar(item["target"], what);
      if (defined(item["uid"]))
        r.uid = scalar(item["uid"], what);
      if (defined(item["gid"]))
        r.gid = scalar(item["gid"], what);
      if (defined(item["mode"]))
        r.mode = file_mode(scalar(item["mode"], what), what);
    } else {
      throw ConfigError(what + ": expected a name or a map");
    }
    out.push_back(std::move(r));
  }
  return out;
}

static std::vector<NetworkAttachment> parse_attachments(const YAML::Node &n,
                                                        const std::string &what) {
  std::vector<NetworkAttachment> out;
  if (!defined(n))
    return out;
  if (n.IsSequence()) {
    for (const auto &item : n)
      out.push_back(NetworkAttachment{scalar(item, what), {}, {}, {}});
    return out;
  }
  if (!n.IsMap())
    throw ConfigError(what + ": expected a list or a map");
  for (const auto &kv : n) {
    NetworkAttachment a;
    a.name = scalar(kv.first, what);
    const auto &v = kv.second;
    if (defined(v)) {
      a.aliases = string_list(v["aliases"], what + "." + a.name + ".aliases");
      if (defined(v["ipv4_address"]))
        a.ipv4_address = scalar(v["ipv4_address"], what);
      if (defined(v["ipv6_address"]))
        a.ipv6_address = scalar(v["ipv6_address"], what);
    }
    out.push_back(std::move(a));
  }
  return out;
}

static std::vector<std::string> parse_extra_hosts(const YAML::Node &n,
                                                  const std::string &what) {
  if (defined(n) && n.IsMap()) {
    std::vector<std::string> out;
    for (const auto &[host, ip] : string_map(n, what))
      out.push_back(host + ":" + ip);
    return out;
  }
  return string_list(n, what);
}

static bool valid_service_name(const std::string &name) {
  if (name.empty())
    return false;
  for (char c : name) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' ||
          c == '-'))
      return false;
  }
  return true;
}

static ServiceSpec load_service(const std::string &name, const YAML::Node &n,
                                const LoadContext &ctx) {
  const std::string svc = "service=" + name;
  auto what = [&](const char *key) { return fmt::format("services.{}.{}", name, key); };

  if (!valid_service_name(name))
    throw ConfigError(fmt::format("invalid service name '{}'", name));
  if (!n.IsMap())
    throw ConfigError(fmt::format("services.{}: expected a map", name));
  warn_unknown_keys(n, kServiceKeys, svc);
  if (defined(n["depends_on"]))
    spdlog::debug("[{}] depends_on does not order startup", svc);

  ServiceSpec s;
  s.name = name;
  if (!defined(n["image"]))
    throw ConfigError(what("image") + " is required");
  s.image = scalar(n["image"], what("image"));

  s.command = command_list(n["command"], what("command"));
  s.entrypoint = command_list(n["entrypoint"], what("entrypoint"));

  for (const auto &f : string_list(n["env_file"], what("env_file"))) {
    fs::path p = f;
    if (p.is_relative())
      p = ctx.working_dir / p;
    for (auto &[k, v] : read_env_file(p))
      s.environment[k] = v;
  }
  for (auto &[k, v] : string_map(n["environment"], what("environment"), &ctx.env))
    s.environment[k] = v;
  s.labels = string_map(n["labels"], what("labels"));

  if (const auto &vols = n["volumes"]; defined(vols)) {
    if (!vols.IsSequence())
      throw ConfigError(what("volumes") + ": expected a list");
    for (const auto &v : vols)
      s.mounts.push_back(parse_volume(v, what("volumes")));
  }
  for (const auto &t : string_list(n["tmpfs"], what("tmpfs"))) {
    Mount m;
    m.type = MountType::Tmpfs;
    auto colon = t.find(':');
    m.target = t.substr(0, colon);
    if (colon != std::string::npos)
      m.tmpfs_size = tmpfs_size_option(t.substr(colon + 1), what("tmpfs"));
    if (m.target.empty() || m.target[0] != '/')
      throw ConfigError(what("tmpfs") + ": target must be an absolute path");
    s.mounts.push_back(std::move(m));
  }

  s.networks = parse_attachments(n["networks"], what("networks"));
  if (defined(n["network_mode"]))
    s.network_mode = scalar(n["network_mode"], what("network_mode"));
  if (!s.network_mode.empty() && !s.networks.empty())
    throw ConfigError(fmt::format(
        "services.{}: network_mode and networks cannot be combined", name));

  if (const auto &ports = n["ports"]; defined(ports)) {
    if (!ports.IsSequence())
      throw ConfigError(what("ports") + ": expected a list");
    for (const auto &p : ports)
      s.ports.push_back(parse_port(p, what("ports")));
  }
  s.expose = string_list(n["expose"], what("expose"));

  if (defined(n["restart"])) {
    s.restart = scalar(n["restart"], what("restart"));
    (void)parse_restart_policy(s.restart);
  }

  s.cap_add = string_list(n["cap_add"], what("cap_add"));
  s.cap_drop = string_list(n["cap_drop"], what("cap_drop"));
  s.security_opt = string_list(n["security_opt"], what("security_opt"));
  if (defined(n["privileged"]))
    s.privileged = boolean(n["privileged"], what("privileged"));
  if (defined(n["read_only"]))
    s.read_only = boolean(n["read_only"], what("read_only"));
  if (defined(n["init"]))
    s.init = boolean(n["init"], what("init"));
  if (defined(n["tty"]))
    s.tty = boolean(n["tty"], what("tty"));
  if (defined(n["stdin_open"]))
    s.stdin_open = boolean(n["stdin_open"], what("stdin_open"));

  auto opt_scalar = [&](const char *key, std::string &dst) {
    if (defined(n[key]))
      dst = scalar(n[key], what(key));
  };
  opt_scalar("user", s.user);
  opt_scalar("userns_mode", s.userns_mode);
  opt_scalar("pid", s.pid);
  opt_scalar("ipc", s.ipc);
  opt_scalar("hostname", s.hostname);
  opt_scalar("domainname", s.domainname);
  opt_scalar("mac_address", s.mac_address);
  opt_scalar("working_dir", s.working_dir);
  opt_scalar("stop_signal", s.stop_signal);
  opt_scalar("shm_size", s.shm_size);
  if (!s.shm_size.empty() && !parse_ram_size(s.shm_size))
    throw ConfigError(what("shm_size") + ": invalid size '" + s.shm_size + "'");

  s.dns = string_list(n["dns"], what("dns"));
  s.dns_search = string_list(n["dns_search"], what("dns_search"));
  s.extra_hosts = parse_extra_hosts(n["extra_hosts"], what("extra_hosts"));
  s.sysctls = string_map(n["sysctls"], what("sysctls"));

  s.configs = parse_file_refs(n["configs"], what("configs"));
  s.secrets = parse_file_refs(n["secrets"], what("secrets"));
  return s;
}

// external: true | external: {name: x}
static bool parse_external(const YAML::Node &n, const std::string &what,
                           std::string &name) {
  if (!defined(n))
    return false;
  if (n.IsMap()) {
    if (defined(n["name"]))
      name = scalar(n["name"], what + ".name");
    return true;
  }
  return boolean(n, what);
}

static void load_networks(const YAML::Node &root, Project &p) {
  const auto &nets = root["networks"];
  if (!defined(nets))
    return;
  if (!nets.IsMap())
    throw ConfigError("networks: expected a map");
  for (const auto &kv : nets) {
    const auto key = scalar(kv.first, "networks");
    const auto what = "networks." + key;
    const auto &v = kv.second;
    NetworkDef def;
    std::string explicit_name;
    if (defined(v)) {
      if (!v.IsMap())
        throw ConfigError(what + ": expected a map");
      if (defined(v["driver"]))
        def.driver = scalar(v["driver"], what + ".driver");
      def.driver_opts = string_map(v["driver_opts"], what + ".driver_opts");
      def.labels = string_map(v["labels"], what + ".labels");
      def.external = parse_external(v["external"], what + ".external", explicit_name);
      if (defined(v["name"]))
        explicit_name = scalar(v["name"], what + ".name");
      if (defined(v["internal"]))
        def.internal = boolean(v["internal"], what + ".internal");
      if (defined(v["attachable"]))
        def.attachable = boolean(v["attachable"], what + ".attachable");
      if (defined(v["ipam"]))
        spdlog::warn("[network={}] ipam configuration is not supported", key);
    }
    if (!explicit_name.empty())
      def.name = explicit_name;
    else
      def.name = def.external ? key : p.name + "_" + key;
    p.networks.emplace(key, std::move(def));
  }
}

static void load_volumes(const YAML::Node &root, Project &p) {
  const auto &vols = root["volumes"];
  if (!defined(vols))
    return;
  if (!vols.IsMap())
    throw ConfigError("volumes: expected a map");
  for (const auto &kv : vols) {
    const auto key = scalar(kv.first, "volumes");
    const auto what = "volumes." + key;
    const auto &v = kv.second;
    VolumeDef def;
    std::string explicit_name;
    if (defined(v)) {
      if (!v.IsMap())
        throw ConfigError(what + ": expected a map");
      if (defined(v["driver"]))
        def.driver = scalar(v["driver"], what + ".driver");
      def.driver_opts = string_map(v["driver_opts"], what + ".driver_opts");
      def.labels = string_map(v["labels"], what + ".labels");
      def.external = parse_external(v["external"], what + ".external", explicit_name);
      if (defined(v["name"]))
        explicit_name = scalar(v["name"], what + ".name");
    }
    if (!explicit_name.empty())
      def.name = explicit_name;
    else
      def.name = def.external ? key : p.name + "_" + key;
    p.volumes.emplace(key, std::move(def));
  }
}

static void load_files(const YAML::Node &root, const char *section,
                       std::map<std::string, FileDef> &dst) {
  const auto &items = root[section];
  if (!defined(items))
    return;
  if (!items.IsMap())
    throw ConfigError(std::string(section) + ": expected a map");
  for (const auto &kv : items) {
    const auto key = scalar(kv.first, section);
    const auto what = fmt::format("{}.{}", section, key);
    const auto &v = kv.second;
    if (!defined(v) || !v.IsMap())
      throw ConfigError(what + ": expected a map");
    FileDef def;
    std::string ignored;
    def.external = parse_external(v["external"], what + ".external", ignored);
    if (defined(v["file"]))
      def.file = scalar(v["file"], what + ".file");
    else if (!def.external)
      throw ConfigError(what + ": file is required");
    dst.emplace(key, std::move(def));
  }
}

static void validate_references(const Project &p) {
  for (const auto &s : p.services) {
    for (const auto &a : s.networks) {
      if (!p.networks.count(a.name))
        throw ConfigError(fmt::format(
            "service {} refers to undefined network {}", s.name, a.name));
    }
    for (const auto &m : s.mounts) {
      if (m.type == MountType::Volume && !m.source.empty() &&
          !p.volumes.count(m.source))
        throw ConfigError(fmt::format(
            "service {} refers to undefined volume {}", s.name, m.source));
    }
    for (const auto &c : s.configs) {
      if (!p.configs.count(c.source))
        throw ConfigError(fmt::format(
            "service {} refers to undefined config {}", s.name, c.source));
    }
    for (const auto &c : s.secrets) {
      if (!p.secrets.count(c.source))
        throw ConfigError(fmt::format(
            "service {} refers to undefined secret {}", s.name, c.source));
    }
  }
}

Project ConfigLoader::load_string(const std::string &yaml,
                                  const fs::path &working_dir,
                                  const std::string &project_name,
                                  const Environment &env) {
  try {
    YAML::Node root = YAML::Load(yaml);
    if (!root.IsMap())
      throw ConfigError("top-level element must be a map");
    interpolate_tree(root, env);
    warn_unknown_keys(root, kRootKeys, "config");

    Project p;
    p.working_dir = working_dir;
    // down derives the name without reading the file, so a top-level
    // name key never selects the project
    if (defined(root["name"]))
      spdlog::debug("[config] top-level name is ignored, use -p");
    if (!project_name.empty())
      p.name = normalize_project_name(project_name);
    else
      p.name = normalize_project_name(working_dir.filename().string());

    load_networks(root, p);
    load_volumes(root, p);
    load_files(root, "configs", p.configs);
    load_files(root, "secrets", p.secrets);

    const auto &services = root["services"];
    if (!defined(services) || !services.IsMap())
      throw ConfigError("services: expected a map");
    LoadContext ctx{working_dir, env, p.name};
    for (const auto &kv : services) {
      auto name = scalar(kv.first, "services");
      if (p.find_service(name))
        throw ConfigError("duplicate service " + name);
      p.services.push_back(load_service(name, kv.second, ctx));
    }

    // services without explicit networking join the implicit default network
    for (auto &s : p.services) {
      if (s.networks.empty() && s.network_mode.empty()) {
        s.networks.push_back(NetworkAttachment{"default", {}, {}, {}});
        if (!p.networks.count("default"))
          p.networks.emplace("default",
                             NetworkDef{p.name + "_default", {}, {}, {},
                                        false, false, false});
      }
    }
    validate_references(p);
    return p;
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("yaml: ") + e.what());
  }
}

Project ConfigLoader::load(const fs::path &file,
                           const std::string &project_name) {
  std::ifstream in(file, std::ios::binary);
  if (!in)
    throw ConfigError("cannot read configuration file " + file.string());
  std::string yaml((std::istreambuf_iterator<char>(in)), {});

  const auto working_dir = fs::absolute(file).lexically_normal().parent_path();
  const auto env = load_environment(working_dir);
  spdlog::debug("[config] loading {} from {}", file.filename().string(),
                working_dir.string());
  try {
    return load_string(yaml, working_dir, project_name, env);
  } catch (const ConfigError &e) {
    throw ConfigError(fmt::format("{}: {}", file.string(), e.what()));
  }
}

fs::path find_default_config(const fs::path &dir) {
  for (const char *name : {"compose.yaml", "compose.yml", "docker-compose.yml",
                           "docker-compose.yaml"}) {
    std::error_code ec;
    if (fs::is_regular_file(dir / name, ec))
      return dir / name;
  }
  return dir / "compose.yaml";
}

} // namespace stackup
