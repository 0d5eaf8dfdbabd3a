#include <doctest/doctest.h>

#include "h0st/core/verbosity.hpp"
#include "test_helpers.hpp"

using h0st::test_helpers::scoped_log_level;

TEST_CASE("verbosity counts map to log levels") {
  CHECK(h0st::verbosity_level(-1) == redlog::level::info);
  CHECK(h0st::verbosity_level(0) == redlog::level::info);
  CHECK(h0st::verbosity_level(1) == redlog::level::verbose);
  CHECK(h0st::verbosity_level(2) == redlog::level::trace);
  CHECK(h0st::verbosity_level(3) == redlog::level::debug);
  CHECK(h0st::verbosity_level(4) == redlog::level::pedantic);
  CHECK(h0st::verbosity_level(12) == redlog::level::pedantic);
}

TEST_CASE("effective verbosity takes the larger request") {
  h0st::host_config config;
  CHECK(h0st::effective_verbosity(0, config) == 0);
  CHECK(h0st::effective_verbosity(2, config) == 2);

  config.verbose = 3;
  CHECK(h0st::effective_verbosity(1, config) == 3);
  CHECK(h0st::effective_verbosity(4, config) == 4);
}

TEST_CASE("configured verbosity raises the global level") {
  scoped_log_level restore(redlog::level::info);

  h0st::host_config config;
  CHECK_FALSE(h0st::apply_configured_verbosity(config));
  CHECK(redlog::get_level() == redlog::level::info);

  config.verbose = 2;
  CHECK(h0st::apply_configured_verbosity(config));
  CHECK(redlog::get_level() == redlog::level::trace);
}

TEST_CASE("configured verbosity never lowers an explicit level") {
  scoped_log_level restore(redlog::level::pedantic);

  h0st::host_config config;
  config.verbose = 1;
  CHECK_FALSE(h0st::apply_configured_verbosity(config));
  CHECK(redlog::get_level() == redlog::level::pedantic);
}
