#pragma once

#include <redlog.hpp>

#include "config.hpp"

namespace h0st {

// -v count or H0ST_VERBOSE value to a log level: 0 info, 1 verbose, 2 trace, 3 debug, 4+ pedantic
redlog::level verbosity_level(int count);

// the larger of an explicit count (e.g. -v flags) and H0ST_VERBOSE
int effective_verbosity(int count, const host_config& config);

void apply_verbosity(int count);

/**
 * @brief Raise the global log level to H0ST_VERBOSE
 *
 * Does nothing when H0ST_VERBOSE is unset or zero, and never lowers a level that is already more verbose.
 * Returns true when the level was changed.
 */
bool apply_configured_verbosity(const host_config& config);

} // namespace h0st
