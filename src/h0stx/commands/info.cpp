#include "info.hpp"

#include <iostream>

#include <redlog.hpp>

#include "h0st/h0st.hpp"

namespace h0stx::commands {

int info_command() {
  auto log = redlog::get_logger("h0stx.info");

  const h0st::snapshot& snap = h0st::current_snapshot();
  auto family = h0st::current_family();
  log.vrb("host snapshot ready", redlog::field("name", snap.name));

  std::cout << "name:           " << snap.name << "\n";
  std::cout << "arch:           " << snap.arch << "\n";
  std::cout << "version:        " << snap.version << "\n";
  std::cout << "path separator: " << snap.path_separator << "\n";
  std::cout << "family:         " << family.value_or("(none)") << std::endl;

  if (!family) {
    log.wrn("unsupported platform, no os family matches");
  }
  return 0;
}

} // namespace h0stx::commands
