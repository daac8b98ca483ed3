#pragma once
#include "http.hpp"
#include "runtime.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

namespace docker {
// Engine API wire format
nlohmann::json encode(const ContainerCreateRequest &req);
nlohmann::json encode(const EndpointSettings &ep);
nlohmann::json encode(const NetworkCreateRequest &req);
nlohmann::json encode(const VolumeCreateRequest &req);
ContainerSummary decode_container(const nlohmann::json &j);
NetworkSummary decode_network(const nlohmann::json &j);
VolumeSummary decode_volume(const nlohmann::json &j);
// {"label":["<key>=<value>"]}, url-encoded
std::string label_filter(const std::string &key, const std::string &value);
} // namespace docker

class DockerClient : public RuntimeClient {
public:
  explicit DockerClient(HttpEndpoint ep, std::string api_version = {});

  // DOCKER_HOST (default unix:///var/run/docker.sock), DOCKER_API_VERSION
  static DockerClient from_env();

  std::vector<ContainerSummary>
  list_containers(const std::string &project) override;
  std::string create_container(const ContainerCreateRequest &req) override;
  void start_container(const std::string &id) override;
  void stop_container(const std::string &id) override;
  void remove_container(const std::string &id) override;
  void connect_network(const std::string &container_id,
                       const std::string &network,
                       const EndpointSettings &endpoint) override;

  std::optional<NetworkSummary> find_network(const std::string &name) override;
  std::string create_network(const NetworkCreateRequest &req) override;
  std::vector<NetworkSummary> list_networks(const std::string &project) override;
  void remove_network(const std::string &id) override;

  std::optional<VolumeSummary> find_volume(const std::string &name) override;
  std::string create_volume(const VolumeCreateRequest &req) override;
  std::vector<VolumeSummary> list_volumes(const std::string &project) override;
  void remove_volume(const std::string &name) override;

private:
  HttpResponse call(const std::string &method, const std::string &path,
                    const nlohmann::json *body = nullptr);
  nlohmann::json call_json(const std::string &method, const std::string &path,
                           const nlohmann::json *body = nullptr);
  [[noreturn]] void fail(const std::string &what, const HttpResponse &r) const;

  HttpEndpoint ep_;
  std::string prefix_; // "/v1.41" or empty
};

} // namespace stackup
