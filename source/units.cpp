#include <stackup/units.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace stackup {

static int unit_shift(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
  case 'k': return 1;
  case 'm': return 2;
  case 'g': return 3;
  case 't': return 4;
  case 'p': return 5;
  default: return 0;
  }
}

std::optional<std::int64_t> parse_ram_size(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
    ++i;
  if (i == 0)
    return std::nullopt;
  if (i < s.size() && s[i] == '.') {
    std::size_t frac = ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
      ++i;
    if (i == frac)
      return std::nullopt;
  }
  const double value = std::strtod(std::string(s.substr(0, i)).c_str(), nullptr);

  if (i < s.size() && s[i] == ' ')
    ++i;
  int shift = 0;
  if (i < s.size() && (shift = unit_shift(s[i])) != 0) {
    ++i;
    if (i < s.size() && (s[i] == 'i' || s[i] == 'I'))
      ++i;
  }
  if (i < s.size() && (s[i] == 'b' || s[i] == 'B'))
    ++i;
  if (i != s.size())
    return std::nullopt;

  const double bytes = value * std::pow(1024.0, shift);
  if (bytes >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
    return std::nullopt;
  return static_cast<std::int64_t>(bytes);
}

} // namespace stackup
