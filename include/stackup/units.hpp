#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace stackup {

// "128m", "1.5g", "64 KiB", "1024" -> bytes (binary multiples).
// std::nullopt for anything else.
std::optional<std::int64_t> parse_ram_size(std::string_view s);

} // namespace stackup
