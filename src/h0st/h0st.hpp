#pragma once

#include <optional>
#include <set>
#include <string>

// core types
#include "core/family.hpp"
#include "core/result.hpp"
#include "core/snapshot.hpp"

// classification and queries
#include "core/classifier.hpp"
#include "core/query.hpp"
#include "core/query_builder.hpp"
#include "core/resolver.hpp"

namespace h0st {

// checks against current_snapshot(); a null pointer is an invalid_argument error
result<bool> is_family(const std::string& family);
result<bool> is_family(const char* family);
result<bool> is_name(const std::string& name);
result<bool> is_name(const char* name);
result<bool> is_arch(const std::string& arch);
result<bool> is_arch(const char* arch);
result<bool> is_version(const std::string& version);
result<bool> is_version(const char* version);

/**
 * @brief Match the running host against any combination of family, name, arch and version
 *
 * Absent arguments are not checked; with every argument absent the result is false.
 */
result<bool> is_os(
    std::optional<std::string> family, std::optional<std::string> name = std::nullopt,
    std::optional<std::string> arch = std::nullopt, std::optional<std::string> version = std::nullopt
);

// null pointers count as absent
result<bool> is_os(
    const char* family, const char* name = nullptr, const char* arch = nullptr, const char* version = nullptr
);

// representative family of the running host, nullopt on unsupported platforms
std::optional<std::string> current_family();

} // namespace h0st
