#pragma once

#include <optional>
#include <string>

#include "result.hpp"
#include "snapshot.hpp"

namespace h0st {

// match criteria; absent fields are "don't care"
struct query {
  std::optional<std::string> family;
  std::optional<std::string> name;
  std::optional<std::string> arch;
  std::optional<std::string> version;

  bool empty() const noexcept { return !family && !name && !arch && !version; }
};

/**
 * @brief Evaluate a query against a snapshot
 *
 * Present fields are combined with a logical AND. A query with no fields never matches.
 * The family is classified verbatim and an unknown family fails with error_code::unknown_family;
 * name, arch and version are lowercased and compared for exact equality.
 */
result<bool> matches(const query& criteria, const snapshot& snap);

} // namespace h0st
