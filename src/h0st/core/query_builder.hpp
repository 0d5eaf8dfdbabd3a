#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "query.hpp"
#include "result.hpp"
#include "snapshot.hpp"

namespace h0st {

/**
 * @brief Accumulates query criteria one field at a time
 *
 * Values are lowercased as they are set. Passing a null value records an invalid_argument
 * failure which evaluate() and build() report; the first failure wins.
 *
 *   auto matched = query_builder().set_family("unix").set_arch("x86_64").evaluate();
 */
class query_builder {
public:
  query_builder() = default;
  explicit query_builder(const char* family);

  query_builder& set_family(const char* value);
  query_builder& set_family(std::string_view value);
  query_builder& set_name(const char* value);
  query_builder& set_name(std::string_view value);
  query_builder& set_arch(const char* value);
  query_builder& set_arch(std::string_view value);
  query_builder& set_version(const char* value);
  query_builder& set_version(std::string_view value);

  result<query> build() const;

  // evaluates against current_snapshot()
  result<bool> evaluate() const;
  result<bool> evaluate(const snapshot& snap) const;

private:
  query criteria_;
  status status_;

  void assign(std::optional<std::string>& field, const char* value, const char* field_name);
};

} // namespace h0st
