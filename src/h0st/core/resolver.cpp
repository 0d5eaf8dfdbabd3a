#include "resolver.hpp"

#include <string>

#include <redlog.hpp>

#include "classifier.hpp"

namespace h0st {

std::optional<family> resolve_family(const snapshot& snap) {
  auto log = redlog::get_logger("h0st.resolver");

  for (family candidate : family_priority()) {
    if (classify(candidate, snap)) {
      log.dbg(
          "resolved family", redlog::field("name", snap.name),
          redlog::field("family", std::string(to_string(candidate)))
      );
      return candidate;
    }
  }

  log.wrn(
      "no os family matches host", redlog::field("name", snap.name),
      redlog::field("path_separator", snap.path_separator)
  );
  return std::nullopt;
}

const std::optional<family>& current_family_id() {
  static const std::optional<family> instance = resolve_family(current_snapshot());
  return instance;
}

} // namespace h0st
