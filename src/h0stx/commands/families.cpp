#include "families.hpp"

#include <iostream>

#include "h0st/h0st.hpp"

namespace h0stx::commands {

int families_command() {
  const h0st::snapshot& snap = h0st::current_snapshot();
  const auto& resolved = h0st::current_family_id();

  for (h0st::family value : h0st::family_priority()) {
    char marker = ' ';
    if (resolved && *resolved == value) {
      marker = '*';
    } else if (h0st::classify(value, snap)) {
      marker = '+';
    }
    std::cout << marker << " " << h0st::to_string(value) << "\n";
  }
  std::cout.flush();
  return 0;
}

} // namespace h0stx::commands
