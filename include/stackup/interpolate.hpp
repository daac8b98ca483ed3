#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace stackup {

using Environment = std::map<std::string, std::string>;

// $$, $VAR, ${VAR}, ${VAR:-def}, ${VAR-def}, ${VAR:?msg}, ${VAR?msg}
std::string interpolate(std::string_view in, const Environment &env);

// KEY=VALUE lines; blank lines and # comments skipped, surrounding quotes
// stripped from values
Environment read_env_file(const std::filesystem::path &file);

// project .env (if present) overlaid with the process environment
Environment load_environment(const std::filesystem::path &project_dir);

} // namespace stackup
