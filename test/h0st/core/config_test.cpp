#include <doctest/doctest.h>

#include "h0st/core/config.hpp"
#include "test_helpers.hpp"

using h0st::test_helpers::clean_host_env;
using h0st::test_helpers::scoped_env;

TEST_CASE("host config defaults to no overrides") {
  clean_host_env clean;

  auto config = h0st::host_config::from_environment();
  CHECK_FALSE(config.has_overrides());
  CHECK(config.verbose == 0);
}

TEST_CASE("host config reads H0ST_ variables") {
  clean_host_env clean;
  scoped_env name("H0ST_OS_NAME", "z/OS");
  scoped_env separator("H0ST_PATH_SEPARATOR", ":");
  scoped_env verbose("H0ST_VERBOSE", "3");

  auto config = h0st::host_config::from_environment();
  CHECK(config.has_overrides());
  REQUIRE(config.os_name.has_value());
  CHECK(*config.os_name == "z/OS");
  CHECK_FALSE(config.os_arch.has_value());
  CHECK_FALSE(config.os_version.has_value());
  REQUIRE(config.path_separator.has_value());
  CHECK(*config.path_separator == ":");
  CHECK(config.verbose == 3);
}

TEST_CASE("unparsable verbosity falls back to the default") {
  clean_host_env clean;
  scoped_env verbose("H0ST_VERBOSE", "loud");

  auto config = h0st::host_config::from_environment();
  CHECK(config.verbose == 0);
}

TEST_CASE("scoped_env restores the previous value") {
  clean_host_env clean;
  {
    scoped_env name("H0ST_OS_NAME", "os/2");
    REQUIRE(h0st::host_config::from_environment().os_name.has_value());
    {
      scoped_env nested("H0ST_OS_NAME", "netware");
      CHECK(*h0st::host_config::from_environment().os_name == "netware");
    }
    CHECK(*h0st::host_config::from_environment().os_name == "os/2");
  }
  CHECK_FALSE(h0st::host_config::from_environment().os_name.has_value());
}
