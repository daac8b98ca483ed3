#include <stackup/errors.hpp>
#include <stackup/http.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace stackup {

HttpEndpoint HttpEndpoint::parse(const std::string &docker_host) {
  HttpEndpoint ep;
  if (docker_host.empty()) {
    ep.path = "/var/run/docker.sock";
    return ep;
  }
  if (docker_host.rfind("unix://", 0) == 0) {
    ep.path = docker_host.substr(7);
    if (ep.path.empty())
      throw RuntimeError("DOCKER_HOST: empty socket path");
    return ep;
  }
  if (docker_host.rfind("tcp://", 0) == 0) {
    ep.kind = Kind::Tcp;
    auto rest = docker_host.substr(6);
    if (auto slash = rest.find('/'); slash != std::string::npos)
      rest = rest.substr(0, slash);
    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
      ep.host = rest;
      ep.port = "2375";
    } else {
      ep.host = rest.substr(0, colon);
      ep.port = rest.substr(colon + 1);
    }
    if (ep.host.empty() || ep.port.empty())
      throw RuntimeError("DOCKER_HOST: invalid address " + docker_host);
    return ep;
  }
  throw RuntimeError("DOCKER_HOST: unsupported scheme in " + docker_host);
}

std::string HttpEndpoint::describe() const {
  return kind == Kind::Unix ? "unix://" + path : "tcp://" + host + ":" + port;
}

namespace {

class Socket {
public:
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;

  int fd() const { return fd_; }

private:
  int fd_;
};

} // namespace

static int connect_unix(const std::string &path) {
  sockaddr_un addr{};
  if (path.size() >= sizeof(addr.sun_path))
    throw RuntimeError("socket path too long: " + path);
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0)
    throw RuntimeError(fmt::format("socket: {}", std::strerror(errno)));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    throw RuntimeError(fmt::format("connect unix://{}: {}", path,
                                   std::strerror(err)));
  }
  return fd;
}

static int connect_tcp(const std::string &host, const std::string &port) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  addrinfo *res = nullptr;
  if (int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &res); rc != 0)
    throw RuntimeError(fmt::format("resolve {}: {}", host, gai_strerror(rc)));

  int sock = -1;
  for (addrinfo *rp = res; rp; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
    if (sock < 0)
      continue;
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(res);
  if (sock < 0)
    throw RuntimeError(fmt::format("connect tcp://{}:{}: {}", host, port,
                                   std::strerror(errno)));
  return sock;
}

static void send_all(int fd, const std::string &data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw RuntimeError(fmt::format("send: {}", std::strerror(errno)));
    }
    off += static_cast<size_t>(n);
  }
}

static std::string recv_all(int fd) {
  std::string data;
  char buf[8192];
  while (true) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw RuntimeError(fmt::format("recv: {}", std::strerror(errno)));
    }
    if (n == 0)
      break;
    data.append(buf, static_cast<size_t>(n));
  }
  return data;
}

HttpResponse http_roundtrip(const HttpEndpoint &ep, const HttpRequest &req) {
  Socket sock(ep.kind == HttpEndpoint::Kind::Unix ? connect_unix(ep.path)
                                                  : connect_tcp(ep.host, ep.port));

  std::string wire = fmt::format("{} {} HTTP/1.0\r\n"
                                 "Host: {}\r\n"
                                 "User-Agent: stackup\r\n"
                                 "Connection: close\r\n",
                                 req.method, req.target,
                                 ep.kind == HttpEndpoint::Kind::Unix ? "docker"
                                                                     : ep.host);
  if (!req.body.empty())
    wire += fmt::format("Content-Type: {}\r\n", req.content_type);
  wire += fmt::format("Content-Length: {}\r\n\r\n", req.body.size());
  wire += req.body;

  spdlog::trace("[http] {} {}", req.method, req.target);
  send_all(sock.fd(), wire);
  auto resp = parse_http_response(recv_all(sock.fd()));
  spdlog::trace("[http] {} {} -> {}", req.method, req.target, resp.status);
  return resp;
}

static std::string lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
    s.remove_suffix(1);
  return std::string(s);
}

static std::string dechunk(std::string_view body) {
  std::string out;
  size_t pos = 0;
  while (pos < body.size()) {
    auto eol = body.find("\r\n", pos);
    if (eol == std::string_view::npos)
      throw RuntimeError("malformed chunked response");
    auto size_str = body.substr(pos, eol - pos);
    if (auto semi = size_str.find(';'); semi != std::string_view::npos)
      size_str = size_str.substr(0, semi);
    size_t size = 0;
    try {
      size = std::stoul(std::string(size_str), nullptr, 16);
    } catch (const std::logic_error &) {
      throw RuntimeError("malformed chunk size in response");
    }
    pos = eol + 2;
    if (size == 0)
      break;
    if (size > body.size() - pos)
      throw RuntimeError("truncated chunked response");
    out.append(body.substr(pos, size));
    pos += size + 2;
  }
  return out;
}

HttpResponse parse_http_response(std::string_view raw) {
  auto head_end = raw.find("\r\n\r\n");
  if (head_end == std::string_view::npos)
    throw RuntimeError("malformed HTTP response: no header terminator");
  auto head = raw.substr(0, head_end);
  auto body = raw.substr(head_end + 4);

  HttpResponse r;
  auto line_end = head.find("\r\n");
  auto status_line = head.substr(0, line_end);
  // HTTP/1.1 200 OK
  if (status_line.rfind("HTTP/", 0) != 0)
    throw RuntimeError("malformed HTTP status line");
  auto sp1 = status_line.find(' ');
  if (sp1 == std::string_view::npos)
    throw RuntimeError("malformed HTTP status line");
  auto sp2 = status_line.find(' ', sp1 + 1);
  auto code = status_line.substr(sp1 + 1, sp2 == std::string_view::npos
                                              ? std::string_view::npos
                                              : sp2 - sp1 - 1);
  if (code.size() != 3 ||
      !std::isdigit(static_cast<unsigned char>(code[0])) ||
      !std::isdigit(static_cast<unsigned char>(code[1])) ||
      !std::isdigit(static_cast<unsigned char>(code[2])))
    throw RuntimeError("malformed HTTP status code");
  r.status = (code[0] - '0') * 100 + (code[1] - '0') * 10 + (code[2] - '0');
  if (sp2 != std::string_view::npos)
    r.status_text = trim(status_line.substr(sp2 + 1));

  while (line_end != std::string_view::npos) {
    auto start = line_end + 2;
    line_end = head.find("\r\n", start);
    auto line = head.substr(start, line_end == std::string_view::npos
                                       ? std::string_view::npos
                                       : line_end - start);
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
      continue;
    r.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }

  auto te = r.headers.find("transfer-encoding");
  if (te != r.headers.end() && lower(te->second) == "chunked") {
    r.body = dechunk(body);
  } else if (auto cl = r.headers.find("content-length"); cl != r.headers.end()) {
    size_t len = 0;
    try {
      len = std::stoul(cl->second);
    } catch (const std::logic_error &) {
      throw RuntimeError("malformed Content-Length");
    }
    if (len > body.size())
      throw RuntimeError("truncated HTTP response body");
    r.body = std::string(body.substr(0, len));
  } else {
    r.body = std::string(body);
  }
  return r;
}

std::string url_encode(std::string_view s) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

} // namespace stackup
