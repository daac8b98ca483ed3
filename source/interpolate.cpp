#include <stackup/errors.hpp>
#include <stackup/interpolate.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>

extern char **environ;

namespace fs = std::filesystem;

namespace stackup {

static bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\r' || s.back() == '\n'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

static const std::string *lookup(const Environment &env,
                                 const std::string &name) {
  auto it = env.find(name);
  return it == env.end() ? nullptr : &it->second;
}

static std::string missing(const std::string &name) {
  spdlog::warn("variable {} is not set, substituting an empty string", name);
  return {};
}

// body of ${...}
static std::string expand_braced(std::string_view expr, const Environment &env) {
  size_t n = 0;
  while (n < expr.size() && is_name_char(expr[n]))
    ++n;
  if (n == 0)
    throw ConfigError(fmt::format("invalid interpolation: ${{{}}}", expr));

  const std::string name(expr.substr(0, n));
  const std::string_view op = expr.substr(n);
  const std::string *value = lookup(env, name);
  const bool unset = value == nullptr;
  const bool empty = unset || value->empty();

  if (op.empty())
    return unset ? missing(name) : *value;

  if (op.substr(0, 2) == ":-")
    return empty ? interpolate(op.substr(2), env) : *value;
  if (op[0] == '-')
    return unset ? interpolate(op.substr(1), env) : *value;

  if (op.substr(0, 2) == ":?" || op[0] == '?') {
    const bool fails = op[0] == ':' ? empty : unset;
    if (fails) {
      auto msg = interpolate(op.substr(op[0] == ':' ? 2 : 1), env);
      throw ConfigError(msg.empty()
                            ? fmt::format("required variable {} is missing", name)
                            : fmt::format("required variable {} is missing: {}",
                                          name, msg));
    }
    return *value;
  }
  throw ConfigError(fmt::format("invalid interpolation: ${{{}}}", expr));
}

std::string interpolate(std::string_view in, const Environment &env) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c != '$' || i + 1 >= in.size()) {
      out.push_back(c);
      continue;
    }
    const char next = in[i + 1];
    if (next == '$') {
      out.push_back('$');
      ++i;
    } else if (next == '{') {
      // find the matching brace, defaults may nest ${...}
      int depth = 0;
      size_t close = std::string_view::npos;
      for (size_t k = i + 1; k < in.size(); ++k) {
        if (in[k] == '{') {
          ++depth;
        } else if (in[k] == '}' && --depth == 0) {
          close = k;
          break;
        }
      }
      if (close == std::string_view::npos)
        throw ConfigError(fmt::format("unterminated variable in '{}'", in));
      out += expand_braced(in.substr(i + 2, close - i - 2), env);
      i = close;
    } else if (std::isalpha(static_cast<unsigned char>(next)) || next == '_') {
      size_t k = i + 1;
      while (k < in.size() && is_name_char(in[k]))
        ++k;
      const std::string name(in.substr(i + 1, k - i - 1));
      const std::string *value = lookup(env, name);
      out += value ? *value : missing(name);
      i = k - 1;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static std::string unquote(std::string v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') &&
      v.back() == v.front())
    return v.substr(1, v.size() - 2);
  return v;
}

Environment read_env_file(const fs::path &file) {
  std::ifstream in(file);
  if (!in)
    throw ConfigError("env file not found: " + file.string());
  Environment env;
  std::string line;
  while (std::getline(in, line)) {
    auto s = trim(line);
    if (s.empty() || s[0] == '#')
      continue;
    if (s.rfind("export ", 0) == 0)
      s = trim(s.substr(7));
    auto pos = s.find('=');
    if (pos == std::string::npos) {
      // bare KEY: inherit from the process when set
      if (const char *v = ::getenv(s.c_str()))
        env[s] = v;
      continue;
    }
    auto k = trim(s.substr(0, pos));
    auto v = unquote(trim(s.substr(pos + 1)));
    if (!k.empty())
      env[k] = v;
  }
  return env;
}

Environment load_environment(const fs::path &project_dir) {
  Environment env;
  std::error_code ec;
  const auto dot_env = project_dir / ".env";
  if (fs::is_regular_file(dot_env, ec)) {
    env = read_env_file(dot_env);
    spdlog::debug("loaded {} variables from {}", env.size(), dot_env.string());
  }
  for (char **e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto pos = kv.find('=');
    if (pos == std::string::npos)
      continue;
    env[kv.substr(0, pos)] = kv.substr(pos + 1);
  }
  return env;
}

} // namespace stackup
