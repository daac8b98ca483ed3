#include <stackup/docker.hpp>
#include <stackup/errors.hpp>
#include <stackup/labels.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

using nlohmann::json;

namespace stackup {

namespace docker {

static json string_map(const std::map<std::string, std::string> &m) {
  json j = json::object();
  for (const auto &[k, v] : m)
    j[k] = v;
  return j;
}

json encode(const EndpointSettings &ep) {
  json j = json::object();
  if (!ep.aliases.empty())
    j["Aliases"] = ep.aliases;
  json ipam = json::object();
  if (!ep.ipv4_address.empty())
    ipam["IPv4Address"] = ep.ipv4_address;
  if (!ep.ipv6_address.empty())
    ipam["IPv6Address"] = ep.ipv6_address;
  if (!ipam.empty())
    j["IPAMConfig"] = ipam;
  return j;
}

static json encode_mount(const MountRequest &m) {
  json j = {{"Type", m.type}, {"Target", m.target}, {"ReadOnly", m.read_only}};
  if (!m.source.empty())
    j["Source"] = m.source;
  if (m.type == "tmpfs" && m.tmpfs_size_bytes > 0)
    j["TmpfsOptions"] = {{"SizeBytes", m.tmpfs_size_bytes}};
  return j;
}

json encode(const ContainerCreateRequest &req) {
  json j;
  j["Image"] = req.image;
  if (!req.cmd.empty())
    j["Cmd"] = req.cmd;
  if (!req.entrypoint.empty())
    j["Entrypoint"] = req.entrypoint;
  j["Env"] = req.env;
  j["Labels"] = string_map(req.labels);
  json exposed = json::object();
  for (const auto &p : req.exposed_ports)
    exposed[p] = json::object();
  j["ExposedPorts"] = exposed;
  j["Hostname"] = req.hostname;
  j["Domainname"] = req.domainname;
  j["User"] = req.user;
  j["WorkingDir"] = req.working_dir;
  if (!req.stop_signal.empty())
    j["StopSignal"] = req.stop_signal;
  if (!req.mac_address.empty())
    j["MacAddress"] = req.mac_address;
  j["Tty"] = req.tty;
  j["OpenStdin"] = req.open_stdin;

  json host;
  host["NetworkMode"] = req.network_mode;
  host["RestartPolicy"] = {{"Name", req.restart_policy.name},
                           {"MaximumRetryCount",
                            req.restart_policy.maximum_retry_count}};
  json mounts = json::array();
  for (const auto &m : req.mounts)
    mounts.push_back(encode_mount(m));
  host["Mounts"] = mounts;
  json bindings = json::object();
  for (const auto &[port, list] : req.port_bindings) {
    json arr = json::array();
    for (const auto &b : list)
      arr.push_back({{"HostIp", b.host_ip}, {"HostPort", b.host_port}});
    bindings[port] = arr;
  }
  host["PortBindings"] = bindings;
  host["CapAdd"] = req.cap_add;
  host["CapDrop"] = req.cap_drop;
  host["SecurityOpt"] = req.security_opt;
  host["Dns"] = req.dns;
  host["DnsSearch"] = req.dns_search;
  host["ExtraHosts"] = req.extra_hosts;
  host["Sysctls"] = string_map(req.sysctls);
  if (!req.ipc_mode.empty())
    host["IpcMode"] = req.ipc_mode;
  if (!req.pid_mode.empty())
    host["PidMode"] = req.pid_mode;
  if (!req.userns_mode.empty())
    host["UsernsMode"] = req.userns_mode;
  host["Privileged"] = req.privileged;
  host["ReadonlyRootfs"] = req.readonly_rootfs;
  if (req.init)
    host["Init"] = *req.init;
  if (req.shm_size > 0)
    host["ShmSize"] = req.shm_size;
  j["HostConfig"] = host;

  if (req.endpoint) {
    j["NetworkingConfig"] = {
        {"EndpointsConfig",
         {{req.endpoint->first, encode(req.endpoint->second)}}}};
  }
  return j;
}

json encode(const NetworkCreateRequest &req) {
  json j = {{"Name", req.name},
            {"CheckDuplicate", true},
            {"Internal", req.internal},
            {"Attachable", req.attachable},
            {"Options", string_map(req.options)},
            {"Labels", string_map(req.labels)}};
  if (!req.driver.empty())
    j["Driver"] = req.driver;
  return j;
}

json encode(const VolumeCreateRequest &req) {
  json j = {{"Name", req.name},
            {"DriverOpts", string_map(req.driver_opts)},
            {"Labels", string_map(req.labels)}};
  if (!req.driver.empty())
    j["Driver"] = req.driver;
  return j;
}

// the engine sends null instead of {} for empty label sets
static std::map<std::string, std::string> labels_of(const json &j) {
  std::map<std::string, std::string> out;
  auto it = j.find("Labels");
  if (it == j.end() || !it->is_object())
    return out;
  for (const auto &el : it->items())
    if (el.value().is_string())
      out[el.key()] = el.value().get<std::string>();
  return out;
}

ContainerSummary decode_container(const json &j) {
  ContainerSummary c;
  c.id = j.at("Id").get<std::string>();
  if (auto it = j.find("Names"); it != j.end() && it->is_array())
    c.names = it->get<std::vector<std::string>>();
  c.state = j.value("State", std::string{});
  c.labels = labels_of(j);
  return c;
}

NetworkSummary decode_network(const json &j) {
  NetworkSummary n;
  n.id = j.at("Id").get<std::string>();
  n.name = j.at("Name").get<std::string>();
  n.labels = labels_of(j);
  return n;
}

VolumeSummary decode_volume(const json &j) {
  VolumeSummary v;
  v.name = j.at("Name").get<std::string>();
  v.driver = j.value("Driver", std::string{});
  v.labels = labels_of(j);
  return v;
}

std::string label_filter(const std::string &key, const std::string &value) {
  json f = {{"label", json::array({key + "=" + value})}};
  return url_encode(f.dump());
}

} // namespace docker

DockerClient::DockerClient(HttpEndpoint ep, std::string api_version)
    : ep_(std::move(ep)) {
  if (!api_version.empty())
    prefix_ = api_version[0] == 'v' ? "/" + api_version : "/v" + api_version;
}

DockerClient DockerClient::from_env() {
  const char *host = std::getenv("DOCKER_HOST");
  const char *version = std::getenv("DOCKER_API_VERSION");
  DockerClient c(HttpEndpoint::parse(host ? host : ""), version ? version : "");
  spdlog::debug("[docker] endpoint {}{}", c.ep_.describe(),
                c.prefix_.empty() ? "" : " api " + c.prefix_.substr(1));
  return c;
}

HttpResponse DockerClient::call(const std::string &method,
                                const std::string &path, const json *body) {
  HttpRequest req;
  req.method = method;
  req.target = prefix_ + path;
  if (body)
    req.body = body->dump();
  return http_roundtrip(ep_, req);
}

json DockerClient::call_json(const std::string &method, const std::string &path,
                             const json *body) {
  auto resp = call(method, path, body);
  if (resp.status >= 400)
    fail(method + " " + path, resp);
  if (resp.body.empty())
    return json();
  try {
    return json::parse(resp.body);
  } catch (const json::exception &e) {
    throw RuntimeError(fmt::format("{} {}: invalid JSON response: {}", method,
                                   path, e.what()),
                       resp.status);
  }
}

void DockerClient::fail(const std::string &what, const HttpResponse &r) const {
  std::string message = r.status_text;
  auto j = json::parse(r.body, nullptr, false);
  if (j.is_object() && j.contains("message") && j["message"].is_string())
    message = j["message"].get<std::string>();
  else if (!r.body.empty() && j.is_discarded())
    message = r.body;
  while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
    message.pop_back();
  throw RuntimeError(fmt::format("{}: {} {}", what, r.status, message),
                     r.status);
}

// decode_* throw json exceptions on unexpected shapes
template <typename F> static auto decoding(const std::string &what, F &&f) {
  try {
    return f();
  } catch (const json::exception &e) {
    throw RuntimeError(fmt::format("{}: unexpected response: {}", what, e.what()));
  }
}

std::vector<ContainerSummary>
DockerClient::list_containers(const std::string &project) {
  auto path = "/containers/json?all=1&filters=" +
              docker::label_filter(labels::kProject, project);
  auto j = call_json("GET", path);
  return decoding("list containers", [&] {
    std::vector<ContainerSummary> out;
    for (const auto &c : j)
      out.push_back(docker::decode_container(c));
    return out;
  });
}

std::string DockerClient::create_container(const ContainerCreateRequest &req) {
  auto body = docker::encode(req);
  auto j = call_json("POST", "/containers/create?name=" + url_encode(req.name),
                     &body);
  auto id = decoding("create container",
                     [&] { return j.at("Id").get<std::string>(); });
  if (auto w = j.find("Warnings"); w != j.end() && w->is_array())
    for (const auto &msg : *w)
      if (msg.is_string())
        spdlog::warn("[docker] {}: {}", req.name, msg.get<std::string>());
  return id;
}

void DockerClient::start_container(const std::string &id) {
  auto r = call("POST", "/containers/" + id + "/start");
  if (r.status >= 400)
    fail("start container " + id, r);
}

void DockerClient::stop_container(const std::string &id) {
  auto r = call("POST", "/containers/" + id + "/stop");
  if (r.status >= 400)
    fail("stop container " + id, r);
}

void DockerClient::remove_container(const std::string &id) {
  auto r = call("DELETE", "/containers/" + id + "?force=1");
  if (r.status >= 400)
    fail("remove container " + id, r);
}

void DockerClient::connect_network(const std::string &container_id,
                                   const std::string &network,
                                   const EndpointSettings &endpoint) {
  json body = {{"Container", container_id},
               {"EndpointConfig", docker::encode(endpoint)}};
  auto r = call("POST", "/networks/" + url_encode(network) + "/connect", &body);
  if (r.status >= 400)
    fail(fmt::format("connect {} to network {}", container_id, network), r);
}

std::optional<NetworkSummary>
DockerClient::find_network(const std::string &name) {
  auto r = call("GET", "/networks/" + url_encode(name));
  if (r.status == 404)
    return std::nullopt;
  if (r.status >= 400)
    fail("inspect network " + name, r);
  return decoding("inspect network " + name, [&] {
    return docker::decode_network(json::parse(r.body));
  });
}

std::string DockerClient::create_network(const NetworkCreateRequest &req) {
  auto body = docker::encode(req);
  auto j = call_json("POST", "/networks/create", &body);
  return decoding("create network",
                  [&] { return j.at("Id").get<std::string>(); });
}

std::vector<NetworkSummary>
DockerClient::list_networks(const std::string &project) {
  auto j = call_json("GET", "/networks?filters=" +
                                docker::label_filter(labels::kProject, project));
  return decoding("list networks", [&] {
    std::vector<NetworkSummary> out;
    for (const auto &n : j)
      out.push_back(docker::decode_network(n));
    return out;
  });
}

void DockerClient::remove_network(const std::string &id) {
  auto r = call("DELETE", "/networks/" + url_encode(id));
  if (r.status >= 400)
    fail("remove network " + id, r);
}

std::optional<VolumeSummary> DockerClient::find_volume(const std::string &name) {
  auto r = call("GET", "/volumes/" + url_encode(name));
  if (r.status == 404)
    return std::nullopt;
  if (r.status >= 400)
    fail("inspect volume " + name, r);
  return decoding("inspect volume " + name, [&] {
    return docker::decode_volume(json::parse(r.body));
  });
}

std::string DockerClient::create_volume(const VolumeCreateRequest &req) {
  auto body = docker::encode(req);
  auto j = call_json("POST", "/volumes/create", &body);
  return decoding("create volume",
                  [&] { return j.at("Name").get<std::string>(); });
}

std::vector<VolumeSummary>
DockerClient::list_volumes(const std::string &project) {
  auto j = call_json("GET", "/volumes?filters=" +
                                docker::label_filter(labels::kProject, project));
  return decoding("list volumes", [&] {
    std::vector<VolumeSummary> out;
    auto it = j.find("Volumes");
    if (it == j.end() || it->is_null())
      return out;
    for (const auto &v : *it)
      out.push_back(docker::decode_volume(v));
    return out;
  });
}

void DockerClient::remove_volume(const std::string &name) {
  auto r = call("DELETE", "/volumes/" + url_encode(name));
  if (r.status >= 400)
    fail("remove volume " + name, r);
}

} // namespace stackup
