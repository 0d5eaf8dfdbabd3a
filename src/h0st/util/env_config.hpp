#pragma once

#include <optional>
#include <string>

namespace h0st::util {

// reads prefixed environment variables, e.g. env_config("H0ST").get<int>("VERBOSE", 0) reads H0ST_VERBOSE
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  // unset and empty variables both yield nullopt
  std::optional<std::string> get_optional(const std::string& name) const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;

} // namespace h0st::util
