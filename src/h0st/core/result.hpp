#pragma once

#include <string>
#include <utility>

namespace h0st {

// error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  unknown_family
};

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T, typename U> inline result<T> error_result(const result<U>& other) {
  return result<T>{T{}, other.status_info};
}

inline const char* error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::unknown_family:
    return "unknown_family";
  }
  return "unknown";
}

} // namespace h0st
