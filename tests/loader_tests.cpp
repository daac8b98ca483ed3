#include <catch2/catch_all.hpp>
#include <stackup/errors.hpp>
#include <stackup/loader.hpp>

#include <filesystem>
#include <fstream>

using namespace stackup;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("stackup_load_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static Project load(const std::string& yaml, const Environment& env = {}) {
  return ConfigLoader::load_string(yaml, "/srv/myapp", "", env);
}

TEST_CASE("Minimal service joins the implicit default network") {
  auto p = load("services:\n"
                "  web:\n"
                "    image: nginx:1.25\n");
  REQUIRE(p.name == "myapp");
  REQUIRE(p.working_dir == fs::path("/srv/myapp"));
  REQUIRE(p.services.size() == 1);
  const auto& web = p.services[0];
  REQUIRE(web.name == "web");
  REQUIRE(web.image == "nginx:1.25");
  REQUIRE(web.networks.size() == 1);
  REQUIRE(web.networks[0].name == "default");
  REQUIRE(p.networks.at("default").name == "myapp_default");
  REQUIRE_FALSE(p.networks.at("default").external);
}

TEST_CASE("Project name: override beats directory, name key is ignored") {
  const std::string yaml = "name: Other.App\n"
                           "services:\n"
                           "  a:\n"
                           "    image: busybox\n";
  REQUIRE(load(yaml).name == "myapp");
  REQUIRE(ConfigLoader::load_string(yaml, "/srv/x", "Demo_1", {}).name == "demo_1");
  REQUIRE(normalize_project_name("My App-2") == "myapp-2");
  REQUIRE_THROWS_AS(normalize_project_name("..."), ConfigError);
}

TEST_CASE("Services keep declaration order") {
  auto p = load("services:\n"
                "  zeta: {image: a}\n"
                "  alpha: {image: b}\n"
                "  mid: {image: c}\n");
  REQUIRE(p.services.size() == 3);
  REQUIRE(p.services[0].name == "zeta");
  REQUIRE(p.services[1].name == "alpha");
  REQUIRE(p.services[2].name == "mid");
  REQUIRE(p.find_service("alpha") == &p.services[1]);
  REQUIRE(p.find_service("nope") == nullptr);
}

TEST_CASE("Command and entrypoint accept strings and lists") {
  auto p = load("services:\n"
                "  app:\n"
                "    image: busybox\n"
                "    command: sh -c 'echo hello world'\n"
                "    entrypoint: [\"/bin/tini\", \"--\"]\n");
  const auto& s = p.services[0];
  REQUIRE(s.command == std::vector<std::string>{"sh", "-c", "echo hello world"});
  REQUIRE(s.entrypoint == std::vector<std::string>{"/bin/tini", "--"});
}

TEST_CASE("split_command honours quotes and escapes") {
  REQUIRE(split_command("a  b\tc") == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(split_command("echo \"a b\" 'c d'") ==
          std::vector<std::string>{"echo", "a b", "c d"});
  REQUIRE(split_command("a\\ b") == std::vector<std::string>{"a b"});
  REQUIRE(split_command("x ''") == std::vector<std::string>{"x", ""});
  REQUIRE(split_command("").empty());
  REQUIRE_THROWS_AS(split_command("echo 'open"), ConfigError);
}

TEST_CASE("Environment in list and map form, bare keys inherit") {
  Environment env{{"FROM_HOST", "h"}};
  auto p = load("services:\n"
                "  a:\n"
                "    image: busybox\n"
                "    environment:\n"
                "      - A=1\n"
                "      - B=x=y\n"
                "      - FROM_HOST\n"
                "      - NOT_SET\n"
                "  b:\n"
                "    image: busybox\n"
                "    environment:\n"
                "      C: 3\n"
                "      FROM_HOST:\n",
                env);
  const auto& a = p.services[0].environment;
  REQUIRE(a.size() == 3);
  REQUIRE(a.at("A") == "1");
  REQUIRE(a.at("B") == "x=y");
  REQUIRE(a.at("FROM_HOST") == "h");
  const auto& b = p.services[1].environment;
  REQUIRE(b.at("C") == "3");
  REQUIRE(b.at("FROM_HOST") == "h");
}

TEST_CASE("env_file values are overridden by environment") {
  auto dir = mkd("envfile");
  {
    std::ofstream o(dir / "app.env");
    o << "A=from_file\nB=from_file\n";
  }
  auto p = ConfigLoader::load_string("services:\n"
                                     "  a:\n"
                                     "    image: busybox\n"
                                     "    env_file: app.env\n"
                                     "    environment:\n"
                                     "      B: inline\n",
                                     dir, "", {});
  const auto& e = p.services[0].environment;
  REQUIRE(e.at("A") == "from_file");
  REQUIRE(e.at("B") == "inline");
}

TEST_CASE("Values are interpolated from the environment") {
  Environment env{{"TAG", "1.25"}, {"PORT", "8080"}};
  auto p = load("services:\n"
                "  web:\n"
                "    image: nginx:${TAG}\n"
                "    ports: [\"${PORT}:80\"]\n"
                "    labels:\n"
                "      price: $$5\n",
                env);
  const auto& s = p.services[0];
  REQUIRE(s.image == "nginx:1.25");
  REQUIRE(s.ports[0].published == "8080");
  REQUIRE(s.labels.at("price") == "$5");
}

TEST_CASE("Volume short syntax tells binds from named volumes") {
  auto p = load("services:\n"
                "  db:\n"
                "    image: postgres\n"
                "    volumes:\n"
                "      - data:/var/lib/postgresql/data\n"
                "      - ./init:/docker-entrypoint-initdb.d:ro\n"
                "      - /cache\n"
                "    tmpfs:\n"
                "      - /run:size=64m\n"
                "volumes:\n"
                "  data: {}\n");
  const auto& m = p.services[0].mounts;
  REQUIRE(m.size() == 4);
  REQUIRE(m[0].type == MountType::Volume);
  REQUIRE(m[0].source == "data");
  REQUIRE(m[1].type == MountType::Bind);
  REQUIRE(m[1].source == "./init");
  REQUIRE(m[1].read_only);
  REQUIRE(m[2].type == MountType::Volume);
  REQUIRE(m[2].source.empty());
  REQUIRE(m[3].type == MountType::Tmpfs);
  REQUIRE(m[3].target == "/run");
  REQUIRE(m[3].tmpfs_size == "64m");
  REQUIRE(p.volumes.at("data").name == "myapp_data");
}

TEST_CASE("Volume long syntax") {
  auto p = load("services:\n"
                "  app:\n"
                "    image: busybox\n"
                "    volumes:\n"
                "      - type: bind\n"
                "        source: /etc/hosts\n"
                "        target: /etc/hosts\n"
                "        read_only: true\n"
                "      - type: tmpfs\n"
                "        target: /scratch\n"
                "        tmpfs:\n"
                "          size: 1g\n");
  const auto& m = p.services[0].mounts;
  REQUIRE(m.size() == 2);
  REQUIRE(m[0].type == MountType::Bind);
  REQUIRE(m[0].read_only);
  REQUIRE(m[1].type == MountType::Tmpfs);
  REQUIRE(m[1].tmpfs_size == "1g");
}

TEST_CASE("Mount errors are rejected") {
  REQUIRE_THROWS_AS(load("services:\n"
                         "  a:\n"
                         "    image: x\n"
                         "    volumes: [\"data:relative\"]\n"
                         "volumes: {data: {}}\n"),
                    ConfigError);
  REQUIRE_THROWS_AS(load("services:\n"
                         "  a:\n"
                         "    image: x\n"
                         "    volumes: [\"undeclared:/data\"]\n"),
                    ConfigError);
  REQUIRE_THROWS_AS(load("services:\n"
                         "  a:\n"
                         "    image: x\n"
                         "    volumes:\n"
                         "      - type: bind\n"
                         "        target: /x\n"),
                    ConfigError);
}

TEST_CASE("Networks: list, map with aliases, external and explicit names") {
  auto p = load("services:\n"
                "  api:\n"
                "    image: api\n"
                "    networks:\n"
                "      front:\n"
                "        aliases: [backend]\n"
                "        ipv4_address: 172.20.0.5\n"
                "      shared: {}\n"
                "  worker:\n"
                "    image: w\n"
                "    networks: [front]\n"
                "networks:\n"
                "  front:\n"
                "    driver: bridge\n"
                "    internal: true\n"
                "  shared:\n"
                "    external: true\n"
                "  named:\n"
                "    name: exact-name\n");
  const auto& api = p.services[0];
  REQUIRE(api.networks.size() == 2);
  REQUIRE(api.networks[0].name == "front");
  REQUIRE(api.networks[0].aliases == std::vector<std::string>{"backend"});
  REQUIRE(api.networks[0].ipv4_address == "172.20.0.5");
  REQUIRE(api.networks[1].name == "shared");
  REQUIRE(p.services[1].networks[0].name == "front");

  REQUIRE(p.networks.at("front").name == "myapp_front");
  REQUIRE(p.networks.at("front").driver == "bridge");
  REQUIRE(p.networks.at("front").internal);
  REQUIRE(p.networks.at("shared").name == "shared");
  REQUIRE(p.networks.at("shared").external);
  REQUIRE(p.networks.at("named").name == "exact-name");
  // every service declared networks, nothing implicit
  REQUIRE(p.networks.count("default") == 0);
}

TEST_CASE("External network with a runtime name") {
  auto p = load("services:\n"
                "  a: {image: x, networks: [proxy]}\n"
                "networks:\n"
                "  proxy:\n"
                "    external:\n"
                "      name: traefik_proxy\n");
  REQUIRE(p.networks.at("proxy").external);
  REQUIRE(p.networks.at("proxy").name == "traefik_proxy");
}

TEST_CASE("network_mode excludes networks and the default network") {
  auto p = load("services:\n"
                "  a:\n"
                "    image: x\n"
                "    network_mode: host\n");
  REQUIRE(p.services[0].network_mode == "host");
  REQUIRE(p.services[0].networks.empty());
  REQUIRE(p.networks.empty());

  REQUIRE_THROWS_AS(load("services:\n"
                         "  a:\n"
                         "    image: x\n"
                         "    network_mode: host\n"
                         "    networks: [default]\n"),
                    ConfigError);
}

TEST_CASE("Ports in short and long form") {
  auto p = load("services:\n"
                "  web:\n"
                "    image: nginx\n"
                "    ports:\n"
                "      - \"80\"\n"
                "      - \"8080:80\"\n"
                "      - \"127.0.0.1:5353:53/udp\"\n"
                "      - target: 443\n"
                "        published: 8443\n"
                "        host_ip: 0.0.0.0\n");
  const auto& ports = p.services[0].ports;
  REQUIRE(ports.size() == 4);
  REQUIRE(ports[0].target == 80);
  REQUIRE(ports[0].published.empty());
  REQUIRE(ports[1].published == "8080");
  REQUIRE(ports[1].target == 80);
  REQUIRE(ports[2].host_ip == "127.0.0.1");
  REQUIRE(ports[2].published == "5353");
  REQUIRE(ports[2].target == 53);
  REQUIRE(ports[2].protocol == "udp");
  REQUIRE(ports[3].target == 443);
  REQUIRE(ports[3].published == "8443");
  REQUIRE(ports[3].protocol == "tcp");
}

TEST_CASE("Port errors are rejected") {
  auto bad = [](const std::string& port) {
    return "services:\n  a:\n    image: x\n    ports: [\"" + port + "\"]\n";
  };
  REQUIRE_THROWS_AS(load(bad("8000-8010:80")), ConfigError);
  REQUIRE_THROWS_AS(load(bad("70000")), ConfigError);
  REQUIRE_THROWS_AS(load(bad("http")), ConfigError);
  REQUIRE_THROWS_AS(load(bad("80/icmp")), ConfigError);
}

TEST_CASE("Scalar options are carried over") {
  auto p = load("services:\n"
                "  a:\n"
                "    image: x\n"
                "    restart: on-failure:3\n"
                "    user: \"1000:1000\"\n"
                "    hostname: box\n"
                "    working_dir: /app\n"
                "    privileged: true\n"
                "    init: false\n"
                "    shm_size: 256m\n"
                "    cap_add: [NET_ADMIN]\n"
                "    expose: [\"9000\"]\n"
                "    extra_hosts:\n"
                "      db.local: 10.0.0.2\n"
                "    sysctls:\n"
                "      net.core.somaxconn: 1024\n");
  const auto& s = p.services[0];
  REQUIRE(s.restart == "on-failure:3");
  REQUIRE(s.user == "1000:1000");
  REQUIRE(s.hostname == "box");
  REQUIRE(s.working_dir == "/app");
  REQUIRE(s.privileged);
  REQUIRE(s.init.has_value());
  REQUIRE_FALSE(*s.init);
  REQUIRE(s.shm_size == "256m");
  REQUIRE(s.cap_add == std::vector<std::string>{"NET_ADMIN"});
  REQUIRE(s.expose == std::vector<std::string>{"9000"});
  REQUIRE(s.extra_hosts == std::vector<std::string>{"db.local:10.0.0.2"});
  REQUIRE(s.sysctls.at("net.core.somaxconn") == "1024");
}

TEST_CASE("Configs and secrets") {
  auto p = load("services:\n"
                "  a:\n"
                "    image: x\n"
                "    configs:\n"
                "      - app_conf\n"
                "    secrets:\n"
                "      - source: db_pass\n"
                "        target: password\n"
                "        mode: 0440\n"
                "configs:\n"
                "  app_conf:\n"
                "    file: ./app.conf\n"
                "secrets:\n"
                "  db_pass:\n"
                "    file: ./secret.txt\n");
  const auto& s = p.services[0];
  REQUIRE(s.configs.size() == 1);
  REQUIRE(s.configs[0].source == "app_conf");
  REQUIRE(s.secrets[0].target == "password");
  REQUIRE(s.secrets[0].mode == 0440u);
  REQUIRE(p.configs.at("app_conf").file == "./app.conf");

  REQUIRE_THROWS_AS(load("services:\n"
                         "  a: {image: x, configs: [nope]}\n"),
                    ConfigError);
}

TEST_CASE("Invalid configurations raise ConfigError") {
  // no image
  REQUIRE_THROWS_AS(load("services:\n  a:\n    command: ls\n"), ConfigError);
  // no services
  REQUIRE_THROWS_AS(load("name: x\n"), ConfigError);
  // not a map
  REQUIRE_THROWS_AS(load("- a\n- b\n"), ConfigError);
  // broken yaml
  REQUIRE_THROWS_AS(load("services: [\n"), ConfigError);
  // bad restart policy
  REQUIRE_THROWS_AS(load("services:\n  a: {image: x, restart: sometimes}\n"),
                    ConfigError);
  // bad shm_size
  REQUIRE_THROWS_AS(load("services:\n  a: {image: x, shm_size: lots}\n"),
                    ConfigError);
  // undefined network
  REQUIRE_THROWS_AS(load("services:\n  a: {image: x, networks: [ghost]}\n"),
                    ConfigError);
  // invalid service name
  REQUIRE_THROWS_AS(load("services:\n  \"a b\": {image: x}\n"), ConfigError);
}

TEST_CASE("ConfigLoader::load reads the file and its .env") {
  auto dir = mkd("file") / "Shop";
  fs::create_directories(dir);
  {
    std::ofstream o(dir / ".env");
    o << "STACKUP_LOADER_TEST_TAG=3.19\n";
  }
  {
    std::ofstream o(dir / "compose.yaml");
    o << "services:\n"
         "  app:\n"
         "    image: alpine:${STACKUP_LOADER_TEST_TAG}\n";
  }
  REQUIRE(find_default_config(dir) == dir / "compose.yaml");
  auto p = ConfigLoader::load(dir / "compose.yaml");
  REQUIRE(p.name == "shop");
  REQUIRE(p.services[0].image == "alpine:3.19");
  REQUIRE(project_name_from_file(dir / "compose.yaml") == "shop");

  REQUIRE_THROWS_AS(ConfigLoader::load(dir / "missing.yaml"), ConfigError);
}

TEST_CASE("up and down derive the same project name from a file with a name key") {
  auto dir = mkd("named") / "MyDir";
  fs::create_directories(dir);
  {
    std::ofstream o(dir / "compose.yaml");
    o << "name: shop\n"
         "services:\n"
         "  app:\n"
         "    image: alpine\n";
  }
  auto f = dir / "compose.yaml";
  REQUIRE(ConfigLoader::load(f, "").name == project_name_from_file(f));
  REQUIRE(ConfigLoader::load(f, "").name == "mydir");
  REQUIRE(ConfigLoader::load(f, "Shop").name == "shop");
}

TEST_CASE("find_default_config falls back to docker-compose.yml") {
  auto dir = mkd("legacy");
  { std::ofstream o(dir / "docker-compose.yml"); o << "services: {}\n"; }
  REQUIRE(find_default_config(dir) == dir / "docker-compose.yml");
}
