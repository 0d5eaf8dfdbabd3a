#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace h0st {

// canonical family identifiers; the spellings are matched verbatim by external configuration
inline constexpr const char* FAMILY_WINDOWS = "windows";
inline constexpr const char* FAMILY_WIN9X = "win9x";
inline constexpr const char* FAMILY_NT = "winnt";
inline constexpr const char* FAMILY_OS2 = "os/2";
inline constexpr const char* FAMILY_NETWARE = "netware";
inline constexpr const char* FAMILY_DOS = "dos";
inline constexpr const char* FAMILY_MAC = "mac";
inline constexpr const char* FAMILY_TANDEM = "tandem";
inline constexpr const char* FAMILY_UNIX = "unix";
inline constexpr const char* FAMILY_OPENVMS = "openvms";
inline constexpr const char* FAMILY_ZOS = "z/os";
inline constexpr const char* FAMILY_OS400 = "os/400";

inline constexpr size_t FAMILY_COUNT = 12;

enum class family : uint8_t {
  windows,
  win9x,
  winnt,
  os2,
  netware,
  dos,
  mac,
  tandem,
  unix_like, // "unix"
  openvms,
  zos,
  os400
};

/**
 * @brief Families in the order used to pick a single representative family for a host
 *
 * Families identified by a distinctive OS name come before the structural families (unix, dos) that
 * only look at the path separator, and "windows" comes before its win9x/winnt subdivisions.
 */
const std::array<family, FAMILY_COUNT>& family_priority();

std::string_view to_string(family value);

// exact, case-sensitive lookup of a canonical identifier
std::optional<family> parse_family(std::string_view token);

std::set<std::string> valid_families();

bool is_valid_family(std::string_view token);
bool is_valid_family(const char* token);

} // namespace h0st
