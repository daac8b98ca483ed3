#include <catch2/catch_all.hpp>
#include <stackup/errors.hpp>
#include <stackup/labels.hpp>
#include <stackup/resources.hpp>

#include "fake_runtime.hpp"

#include <filesystem>
#include <fstream>

using namespace stackup;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("stackup_res_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static Project demo() {
  Project p;
  p.name = "demo";
  p.working_dir = "/srv/demo";
  p.networks["default"] = NetworkDef{"demo_default", {}, {}, {}, false, false, false};
  p.networks["back"] = NetworkDef{"demo_back", "bridge", {{"mtu", "1400"}}, {{"tier", "db"}},
                                  false, true, false};
  p.volumes["data"] = VolumeDef{"demo_data", "local", {}, {}, false};
  return p;
}

TEST_CASE("Missing networks and volumes are created with project labels") {
  FakeRuntime rt;
  auto r = ResourceResolver(rt).resolve(demo());

  REQUIRE(r.networks.at("default") == "demo_default");
  REQUIRE(r.networks.at("back") == "demo_back");
  REQUIRE(r.volumes.at("data") == "demo_data");
  REQUIRE(rt.count("create_network") == 2);
  REQUIRE(rt.count("create_volume") == 1);

  const auto& back = rt.networks.at("demo_back");
  REQUIRE(back.labels.at(labels::kProject) == "demo");
  REQUIRE(back.labels.at(labels::kNetwork) == "back");
  REQUIRE(back.labels.at("tier") == "db");
  const auto& data = rt.volumes.at("demo_data");
  REQUIRE(data.labels.at(labels::kProject) == "demo");
  REQUIRE(data.labels.at(labels::kVolume) == "data");
  REQUIRE(data.driver == "local");
}

TEST_CASE("Resolving twice creates nothing the second time") {
  FakeRuntime rt;
  ResourceResolver(rt).resolve(demo());
  rt.calls.clear();
  auto r = ResourceResolver(rt).resolve(demo());
  REQUIRE(rt.calls.empty());
  REQUIRE(r.networks.size() == 2);
  REQUIRE(r.volumes.size() == 1);
}

TEST_CASE("External resources must already exist") {
  FakeRuntime rt;
  Project p;
  p.name = "demo";
  p.networks["proxy"] = NetworkDef{"traefik", {}, {}, {}, true, false, false};

  REQUIRE_THROWS_AS(ResourceResolver(rt).resolve(p), ResourceError);
  REQUIRE(rt.calls.empty());

  rt.networks["traefik"] = NetworkSummary{"n7", "traefik", {}};
  auto r = ResourceResolver(rt).resolve(p);
  REQUIRE(r.networks.at("proxy") == "traefik");
  REQUIRE(rt.calls.empty());

  Project v;
  v.name = "demo";
  v.volumes["shared"] = VolumeDef{"shared_data", {}, {}, {}, true};
  REQUIRE_THROWS_AS(ResourceResolver(rt).resolve(v), ResourceError);
}

TEST_CASE("Runtime failures while creating resources become ResourceError") {
  FakeRuntime rt;
  rt.fail_on = "create_network demo_back";
  REQUIRE_THROWS_AS(ResourceResolver(rt).resolve(demo()), ResourceError);
}

TEST_CASE("Config and secret files resolve against the project directory") {
  auto dir = mkd("files");
  { std::ofstream o(dir / "app.conf"); o << "listen 80;\n"; }
  FakeRuntime rt;
  Project p;
  p.name = "demo";
  p.working_dir = dir;
  p.configs["app_conf"] = FileDef{"./app.conf", false};
  auto r = ResourceResolver(rt).resolve(p);
  REQUIRE(r.configs.at("app_conf") == (dir / "app.conf").lexically_normal());

  p.secrets["pw"] = FileDef{"missing.txt", false};
  REQUIRE_THROWS_AS(ResourceResolver(rt).resolve(p), ResourceError);

  Project ext;
  ext.name = "demo";
  ext.secrets["pw"] = FileDef{"", true};
  REQUIRE_THROWS_AS(ResourceResolver(rt).resolve(ext), ResourceError);
}
