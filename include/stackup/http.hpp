#pragma once
#include <map>
#include <string>
#include <string_view>

namespace stackup {

struct HttpEndpoint {
  enum class Kind { Unix, Tcp };

  Kind kind = Kind::Unix;
  std::string path; // unix socket path
  std::string host;
  std::string port;

  // unix:///var/run/docker.sock, tcp://host:2375
  static HttpEndpoint parse(const std::string &docker_host);
  std::string describe() const;
};

struct HttpRequest {
  std::string method;
  std::string target; // path + query
  std::string body;
  std::string content_type = "application/json";
};

struct HttpResponse {
  int status = 0;
  std::string status_text;
  std::map<std::string, std::string> headers; // lower-case names
  std::string body;
};

// One request per connection (HTTP/1.0, Connection: close). Transport
// failures throw RuntimeError; HTTP error statuses are returned as-is.
HttpResponse http_roundtrip(const HttpEndpoint &ep, const HttpRequest &req);

HttpResponse parse_http_response(std::string_view raw);

std::string url_encode(std::string_view s);

} // namespace stackup
