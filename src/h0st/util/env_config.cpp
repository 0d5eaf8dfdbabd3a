#include "env_config.hpp"

#include <cstdlib>
#include <exception>

#include <redlog.hpp>

namespace h0st::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

std::optional<std::string> env_config::get_optional(const std::string& name) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    auto log = redlog::get_logger("h0st.config");
    log.wrn(
        "failed to parse as int, using default", redlog::field("name", build_env_name(name)),
        redlog::field("value", value), redlog::field("error", e.what())
    );
    return default_value;
  }
}

} // namespace h0st::util
