#include <stackup/errors.hpp>
#include <stackup/labels.hpp>
#include <stackup/resources.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace stackup {

std::string ResourceResolver::ensure_network(const Project &p,
                                             const std::string &key,
                                             const NetworkDef &def) {
  if (auto found = rt_.find_network(def.name)) {
    if (!def.external) {
      auto it = found->labels.find(labels::kProject);
      if (it == found->labels.end() || it->second != p.name)
        spdlog::warn("[network={}] exists but was not created for project {}",
                     def.name, p.name);
    }
    spdlog::debug("[network={}] found id={}", def.name, found->id);
    return def.name;
  }
  if (def.external)
    throw ResourceError(fmt::format("external network {} not found", def.name));

  NetworkCreateRequest req;
  req.name = def.name;
  req.driver = def.driver;
  req.options = def.driver_opts;
  req.labels = def.labels;
  req.labels[labels::kProject] = p.name;
  req.labels[labels::kNetwork] = key;
  req.internal = def.internal;
  req.attachable = def.attachable;
  auto id = rt_.create_network(req);
  spdlog::info("[network={}] created id={}", def.name, id.substr(0, 12));
  return def.name;
}

std::string ResourceResolver::ensure_volume(const Project &p,
                                            const std::string &key,
                                            const VolumeDef &def) {
  if (auto found = rt_.find_volume(def.name)) {
    spdlog::debug("[volume={}] found", def.name);
    return found->name;
  }
  if (def.external)
    throw ResourceError(fmt::format("external volume {} not found", def.name));

  VolumeCreateRequest req;
  req.name = def.name;
  req.driver = def.driver;
  req.driver_opts = def.driver_opts;
  req.labels = def.labels;
  req.labels[labels::kProject] = p.name;
  req.labels[labels::kVolume] = key;
  auto name = rt_.create_volume(req);
  spdlog::info("[volume={}] created", name);
  return name;
}

// config and secret sources are files relative to the project directory
static fs::path resolve_file(const Project &p, const char *kind,
                             const std::string &key, const FileDef &def) {
  if (def.external)
    throw ResourceError(fmt::format("{} {}: external {}s are not supported",
                                    kind, key, kind));
  fs::path f = def.file;
  if (f.is_relative())
    f = p.working_dir / f;
  f = f.lexically_normal();
  std::error_code ec;
  if (!fs::is_regular_file(f, ec))
    throw ResourceError(fmt::format("{} {}: file {} not found", kind, key,
                                    f.string()));
  return f;
}

ResolvedResources ResourceResolver::resolve(const Project &p) {
  ResolvedResources r;
  try {
    for (const auto &[key, def] : p.networks)
      r.networks[key] = ensure_network(p, key, def);
    for (const auto &[key, def] : p.volumes)
      r.volumes[key] = ensure_volume(p, key, def);
  } catch (const RuntimeError &e) {
    throw ResourceError(e.what());
  }
  for (const auto &[key, def] : p.configs)
    r.configs[key] = resolve_file(p, "config", key, def);
  for (const auto &[key, def] : p.secrets)
    r.secrets[key] = resolve_file(p, "secret", key, def);
  return r;
}

} // namespace stackup
