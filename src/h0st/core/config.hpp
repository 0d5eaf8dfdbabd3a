#pragma once

#include <optional>
#include <string>

namespace h0st {

// process configuration read from H0ST_* environment variables
struct host_config {
  std::optional<std::string> os_name;
  std::optional<std::string> os_arch;
  std::optional<std::string> os_version;
  std::optional<std::string> path_separator;
  int verbose = 0;

  bool has_overrides() const noexcept { return os_name || os_arch || os_version || path_separator; }

  static host_config from_environment();
};

} // namespace h0st
