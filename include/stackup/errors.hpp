#pragma once
#include <stdexcept>
#include <string>

namespace stackup {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// malformed or unreadable configuration; raised before any runtime call
struct ConfigError : Error {
  using Error::Error;
};

// a shared network/volume/config/secret could not be resolved or created
struct ResourceError : Error {
  using Error::Error;
};

// any failed call to the container runtime
class RuntimeError : public Error {
public:
  explicit RuntimeError(const std::string &what, int status = 0)
      : Error(what), status_(status) {}

  int status() const { return status_; }

private:
  int status_;
};

} // namespace stackup
