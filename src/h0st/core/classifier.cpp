#include "classifier.hpp"

#include <redlog.hpp>

#include "util/string_utils.hpp"

namespace h0st {

namespace {

// openjdk and some shells report macos as "darwin"
constexpr std::string_view k_darwin = "darwin";

using util::contains;

bool is_windows(const snapshot& snap) { return contains(snap.name, FAMILY_WINDOWS); }

bool is_win9x(const snapshot& snap) {
  if (!is_windows(snap)) {
    return false;
  }
  // windows ce is not 9x but is grouped with it
  return contains(snap.name, "95") || contains(snap.name, "98") || contains(snap.name, "me") ||
         contains(snap.name, "ce");
}

bool is_netware(const snapshot& snap) { return contains(snap.name, FAMILY_NETWARE); }

bool is_mac(const snapshot& snap) { return contains(snap.name, FAMILY_MAC) || contains(snap.name, k_darwin); }

bool is_openvms(const snapshot& snap) { return contains(snap.name, FAMILY_OPENVMS); }

bool is_unix(const snapshot& snap) {
  if (snap.path_separator != ":" || is_openvms(snap)) {
    return false;
  }
  // classic mac os is not unix; os x reports a name ending in "x"
  return !is_mac(snap) || snap.name.ends_with("x") || contains(snap.name, k_darwin);
}

} // namespace

bool classify(family value, const snapshot& snap) {
  switch (value) {
  case family::windows:
    return is_windows(snap);
  case family::win9x:
    return is_win9x(snap);
  case family::winnt:
    return is_windows(snap) && !is_win9x(snap);
  case family::os2:
    return contains(snap.name, FAMILY_OS2);
  case family::netware:
    return is_netware(snap);
  case family::dos:
    return snap.path_separator == ";" && !is_netware(snap);
  case family::mac:
    return is_mac(snap);
  case family::tandem:
    return contains(snap.name, "nonstop_kernel");
  case family::unix_like:
    return is_unix(snap);
  case family::openvms:
    return is_openvms(snap);
  case family::zos:
    return contains(snap.name, FAMILY_ZOS) || contains(snap.name, "os/390");
  case family::os400:
    return contains(snap.name, FAMILY_OS400);
  }
  return false;
}

result<bool> classify(std::string_view token, const snapshot& snap) {
  auto log = redlog::get_logger("h0st.classifier");
  auto parsed = parse_family(token);
  if (!parsed) {
    log.err("unknown os family", redlog::field("family", std::string(token)));
    return error_result<bool>(
        error_code::unknown_family, "don't know how to detect os family \"" + std::string(token) + "\""
    );
  }

  bool matched = classify(*parsed, snap);
  log.trc(
      "classified", redlog::field("family", std::string(token)), redlog::field("name", snap.name),
      redlog::field("matched", matched)
  );
  return ok_result(matched);
}

result<bool> classify(const char* token, const snapshot& snap) {
  if (token == nullptr) {
    return error_result<bool>(error_code::invalid_argument, "os family must not be null");
  }
  return classify(std::string_view(token), snap);
}

} // namespace h0st
