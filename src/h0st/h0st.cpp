#include "h0st.hpp"

#include <utility>

namespace h0st {

namespace {

std::optional<std::string> optional_token(const char* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

result<bool> null_token(const char* what) {
  return error_result<bool>(error_code::invalid_argument, std::string(what) + " must not be null");
}

} // namespace

result<bool> is_family(const std::string& family) { return is_os(family); }

result<bool> is_family(const char* family) {
  if (family == nullptr) {
    return null_token("os family");
  }
  return is_os(std::string(family));
}

result<bool> is_name(const std::string& name) { return is_os(std::nullopt, name); }

result<bool> is_name(const char* name) {
  if (name == nullptr) {
    return null_token("os name");
  }
  return is_os(std::nullopt, std::string(name));
}

result<bool> is_arch(const std::string& arch) { return is_os(std::nullopt, std::nullopt, arch); }

result<bool> is_arch(const char* arch) {
  if (arch == nullptr) {
    return null_token("os arch");
  }
  return is_os(std::nullopt, std::nullopt, std::string(arch));
}

result<bool> is_version(const std::string& version) {
  return is_os(std::nullopt, std::nullopt, std::nullopt, version);
}

result<bool> is_version(const char* version) {
  if (version == nullptr) {
    return null_token("os version");
  }
  return is_os(std::nullopt, std::nullopt, std::nullopt, std::string(version));
}

result<bool> is_os(
    std::optional<std::string> family, std::optional<std::string> name, std::optional<std::string> arch,
    std::optional<std::string> version
) {
  query criteria;
  criteria.family = std::move(family);
  criteria.name = std::move(name);
  criteria.arch = std::move(arch);
  criteria.version = std::move(version);
  return matches(criteria, current_snapshot());
}

result<bool> is_os(const char* family, const char* name, const char* arch, const char* version) {
  return is_os(optional_token(family), optional_token(name), optional_token(arch), optional_token(version));
}

std::optional<std::string> current_family() {
  const auto& resolved = current_family_id();
  if (!resolved) {
    return std::nullopt;
  }
  return std::string(to_string(*resolved));
}

} // namespace h0st
