#pragma once

#include <string>
#include <string_view>

#include "config.hpp"

namespace h0st {

// host environment as seen by the classifier; name, arch and version are lowercase
struct snapshot {
  std::string name;
  std::string arch;
  std::string version;
  std::string path_separator;

  bool operator==(const snapshot& other) const = default;
};

snapshot make_snapshot(
    std::string_view name, std::string_view arch, std::string_view version, std::string_view path_separator
);

// queries the running host; never fails, falls back to compile-time values
snapshot detect_snapshot();

// release name for a windows version number, e.g. (6, 1, 7601, true) -> "windows 7"
std::string windows_release_name(unsigned major, unsigned minor, unsigned build, bool nt_kernel);

snapshot apply_overrides(snapshot base, const host_config& config);

// reads H0ST_* once: raises the log level for H0ST_VERBOSE, then overrides the detected host
snapshot load_snapshot();

/**
 * @brief Process-wide snapshot
 *
 * Built on first use by load_snapshot(), then never changes.
 */
const snapshot& current_snapshot();

} // namespace h0st
