#pragma once
#include "service.hpp"
#include <string>

namespace stackup {

// Canonical YAML rendering of every field of a service. Stored verbatim in the
// io.stackup.config label and compared byte-for-byte on the next run.
std::string fingerprint(const ServiceSpec &s);

} // namespace stackup
