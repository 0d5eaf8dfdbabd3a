#include "verbosity.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace h0st {

namespace {

constexpr std::array<redlog::level, 5> verbosity_levels = {
    redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic
};

} // namespace

redlog::level verbosity_level(int count) {
  if (count <= 0) {
    return verbosity_levels.front();
  }
  auto index = std::min(static_cast<size_t>(count), verbosity_levels.size() - 1);
  return verbosity_levels[index];
}

int effective_verbosity(int count, const host_config& config) { return std::max(count, config.verbose); }

void apply_verbosity(int count) { redlog::set_level(verbosity_level(count)); }

bool apply_configured_verbosity(const host_config& config) {
  if (config.verbose <= 0) {
    return false;
  }

  redlog::level wanted = verbosity_level(config.verbose);
  if (static_cast<int>(redlog::get_level()) >= static_cast<int>(wanted)) {
    return false;
  }

  redlog::set_level(wanted);
  auto log = redlog::get_logger("h0st.config");
  log.vrb("log level raised from environment", redlog::field("verbose", config.verbose));
  return true;
}

} // namespace h0st
