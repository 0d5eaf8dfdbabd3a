#include "query.hpp"

#include <redlog.hpp>

#include "classifier.hpp"
#include "util/string_utils.hpp"

namespace h0st {

namespace {

bool field_matches(const std::optional<std::string>& expected, const std::string& actual) {
  if (!expected) {
    return true;
  }
  return util::to_lower(*expected) == actual;
}

} // namespace

result<bool> matches(const query& criteria, const snapshot& snap) {
  auto log = redlog::get_logger("h0st.query");

  if (criteria.empty()) {
    log.dbg("query has no criteria, not matching");
    return ok_result(false);
  }

  bool family_ok = true;
  if (criteria.family) {
    auto classified = classify(std::string_view(*criteria.family), snap);
    if (!classified.ok()) {
      return classified;
    }
    family_ok = classified.value;
  }

  bool name_ok = field_matches(criteria.name, snap.name);
  bool arch_ok = field_matches(criteria.arch, snap.arch);
  bool version_ok = field_matches(criteria.version, snap.version);

  bool matched = family_ok && name_ok && arch_ok && version_ok;
  log.dbg(
      "evaluated query", redlog::field("family", criteria.family.value_or("*")),
      redlog::field("name", criteria.name.value_or("*")), redlog::field("arch", criteria.arch.value_or("*")),
      redlog::field("version", criteria.version.value_or("*")), redlog::field("matched", matched)
  );
  return ok_result(matched);
}

} // namespace h0st
