#include "family.hpp"

namespace h0st {

namespace {

constexpr std::array<family, FAMILY_COUNT> k_priority = {
    family::windows, family::os2,    family::netware,   family::os400, family::zos,   family::openvms,
    family::tandem,  family::mac,    family::unix_like, family::dos,   family::win9x, family::winnt,
};

} // namespace

const std::array<family, FAMILY_COUNT>& family_priority() { return k_priority; }

std::string_view to_string(family value) {
  switch (value) {
  case family::windows:
    return FAMILY_WINDOWS;
  case family::win9x:
    return FAMILY_WIN9X;
  case family::winnt:
    return FAMILY_NT;
  case family::os2:
    return FAMILY_OS2;
  case family::netware:
    return FAMILY_NETWARE;
  case family::dos:
    return FAMILY_DOS;
  case family::mac:
    return FAMILY_MAC;
  case family::tandem:
    return FAMILY_TANDEM;
  case family::unix_like:
    return FAMILY_UNIX;
  case family::openvms:
    return FAMILY_OPENVMS;
  case family::zos:
    return FAMILY_ZOS;
  case family::os400:
    return FAMILY_OS400;
  }
  return "unknown";
}

std::optional<family> parse_family(std::string_view token) {
  for (family candidate : k_priority) {
    if (to_string(candidate) == token) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::set<std::string> valid_families() {
  std::set<std::string> valid;
  for (family candidate : k_priority) {
    valid.emplace(to_string(candidate));
  }
  return valid;
}

bool is_valid_family(std::string_view token) { return parse_family(token).has_value(); }

bool is_valid_family(const char* token) {
  if (token == nullptr) {
    return false;
  }
  return is_valid_family(std::string_view(token));
}

} // namespace h0st
