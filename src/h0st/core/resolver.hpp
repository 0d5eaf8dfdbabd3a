#pragma once

#include <optional>

#include "family.hpp"
#include "snapshot.hpp"

namespace h0st {

// first family in family_priority() the snapshot belongs to; informational only
std::optional<family> resolve_family(const snapshot& snap);

// resolve_family(current_snapshot()), computed once
const std::optional<family>& current_family_id();

} // namespace h0st
