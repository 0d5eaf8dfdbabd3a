#include "check.hpp"

#include <iostream>
#include <string_view>

#include <redlog.hpp>

#include "h0st/h0st.hpp"

namespace h0stx::commands {

int check_command(const check_request& request) {
  auto log = redlog::get_logger("h0stx.check");

  h0st::query_builder builder;
  if (request.family) {
    builder.set_family(std::string_view(*request.family));
  }
  if (request.name) {
    builder.set_name(std::string_view(*request.name));
  }
  if (request.arch) {
    builder.set_arch(std::string_view(*request.arch));
  }
  if (request.version) {
    builder.set_version(std::string_view(*request.version));
  }

  if (!request.family && !request.name && !request.arch && !request.version) {
    log.wrn("no criteria given, a query without criteria never matches");
  }

  auto matched = builder.evaluate();
  if (!matched.ok()) {
    log.err(
        "invalid query", redlog::field("code", h0st::error_code_name(matched.status_info.code)),
        redlog::field("error", matched.status_info.message)
    );
    std::cerr << "error: " << matched.status_info.message << std::endl;
    return 2;
  }

  if (!request.quiet) {
    std::cout << (matched.value ? "match" : "no match") << std::endl;
  }
  return matched.value ? 0 : 1;
}

} // namespace h0stx::commands
