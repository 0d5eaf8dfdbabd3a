#include "query_builder.hpp"

#include <redlog.hpp>

#include "util/string_utils.hpp"

namespace h0st {

query_builder::query_builder(const char* family) { set_family(family); }

void query_builder::assign(std::optional<std::string>& field, const char* value, const char* field_name) {
  if (value == nullptr) {
    auto log = redlog::get_logger("h0st.query");
    log.err("null query value", redlog::field("field", field_name));
    if (status_.ok()) {
      status_ = make_status(error_code::invalid_argument, std::string("os ") + field_name + " must not be null");
    }
    return;
  }
  field = util::to_lower(value);
}

query_builder& query_builder::set_family(const char* value) {
  assign(criteria_.family, value, "family");
  return *this;
}

query_builder& query_builder::set_family(std::string_view value) {
  criteria_.family = util::to_lower(value);
  return *this;
}

query_builder& query_builder::set_name(const char* value) {
  assign(criteria_.name, value, "name");
  return *this;
}

query_builder& query_builder::set_name(std::string_view value) {
  criteria_.name = util::to_lower(value);
  return *this;
}

query_builder& query_builder::set_arch(const char* value) {
  assign(criteria_.arch, value, "arch");
  return *this;
}

query_builder& query_builder::set_arch(std::string_view value) {
  criteria_.arch = util::to_lower(value);
  return *this;
}

query_builder& query_builder::set_version(const char* value) {
  assign(criteria_.version, value, "version");
  return *this;
}

query_builder& query_builder::set_version(std::string_view value) {
  criteria_.version = util::to_lower(value);
  return *this;
}

result<query> query_builder::build() const {
  if (!status_.ok()) {
    return result<query>{query{}, status_};
  }
  return ok_result(criteria_);
}

result<bool> query_builder::evaluate() const { return evaluate(current_snapshot()); }

result<bool> query_builder::evaluate(const snapshot& snap) const {
  auto built = build();
  if (!built.ok()) {
    return error_result<bool>(built);
  }
  return matches(built.value, snap);
}

} // namespace h0st
