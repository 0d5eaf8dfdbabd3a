#include "config.hpp"

#include "util/env_config.hpp"

namespace h0st {

host_config host_config::from_environment() {
  util::env_config loader("H0ST");

  host_config config;
  config.os_name = loader.get_optional("OS_NAME");
  config.os_arch = loader.get_optional("OS_ARCH");
  config.os_version = loader.get_optional("OS_VERSION");
  config.path_separator = loader.get_optional("PATH_SEPARATOR");
  config.verbose = loader.get<int>("VERBOSE", 0);
  return config;
}

} // namespace h0st
