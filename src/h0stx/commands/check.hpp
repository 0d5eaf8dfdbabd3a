#pragma once

#include <optional>
#include <string>

namespace h0stx::commands {

struct check_request {
  std::optional<std::string> family;
  std::optional<std::string> name;
  std::optional<std::string> arch;
  std::optional<std::string> version;
  bool quiet = false;
};

// exit codes: 0 match, 1 no match, 2 invalid query
int check_command(const check_request& request);

} // namespace h0stx::commands
