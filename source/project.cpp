#include <stackup/errors.hpp>
#include <stackup/project.hpp>

#include <cctype>

namespace fs = std::filesystem;

namespace stackup {

const ServiceSpec *Project::find_service(const std::string &name) const {
  for (const auto &s : services)
    if (s.name == name)
      return &s;
  return nullptr;
}

std::string normalize_project_name(const std::string &raw) {
  std::string out;
  for (char c : raw) {
    auto lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (std::isalnum(static_cast<unsigned char>(lc)) ||
        ((lc == '_' || lc == '-') && !out.empty()))
      out.push_back(lc);
  }
  if (out.empty())
    throw ConfigError("cannot derive a project name from '" + raw +
                      "', pass --project-name");
  return out;
}

std::string project_name_from_file(const fs::path &config_file) {
  auto dir = fs::absolute(config_file).lexically_normal().parent_path();
  return normalize_project_name(dir.filename().string());
}

} // namespace stackup
