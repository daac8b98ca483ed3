#pragma once

namespace stackup {
namespace labels {

constexpr const char kProject[] = "io.stackup.project";
constexpr const char kService[] = "io.stackup.service";
constexpr const char kConfig[] = "io.stackup.config";
constexpr const char kNetwork[] = "io.stackup.network";
constexpr const char kVolume[] = "io.stackup.volume";

} // namespace labels
} // namespace stackup
