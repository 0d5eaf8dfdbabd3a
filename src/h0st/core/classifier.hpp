#pragma once

#include <string_view>

#include "family.hpp"
#include "result.hpp"
#include "snapshot.hpp"

namespace h0st {

/**
 * @brief Decide whether a snapshot belongs to a family
 *
 * Each family has its own rule, so one snapshot can belong to several families at once
 * (e.g. windows, winnt and dos; or unix and z/os).
 */
bool classify(family value, const snapshot& snap);

// string form; tokens outside the registry fail with error_code::unknown_family
result<bool> classify(std::string_view token, const snapshot& snap);
result<bool> classify(const char* token, const snapshot& snap);

} // namespace h0st
