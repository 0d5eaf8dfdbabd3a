#include <doctest/doctest.h>

#include "h0st/core/resolver.hpp"

namespace {

using h0st::family;
using h0st::make_snapshot;
using h0st::resolve_family;

} // namespace

TEST_CASE("resolution follows the priority list") {
  CHECK(resolve_family(make_snapshot("windows 10", "amd64", "10.0", ";")) == family::windows);
  CHECK(resolve_family(make_snapshot("windows 98", "x86", "4.10", ";")) == family::windows);
  CHECK(resolve_family(make_snapshot("linux", "x86_64", "6.8.0", ":")) == family::unix_like);
  CHECK(resolve_family(make_snapshot("mac os x", "x86_64", "10.15", ":")) == family::mac);
  CHECK(resolve_family(make_snapshot("darwin", "arm64", "23.4.0", ":")) == family::mac);
  CHECK(resolve_family(make_snapshot("z/os", "s390x", "02.05.00", ":")) == family::zos);
  CHECK(resolve_family(make_snapshot("os/2", "x86", "20.45", ";")) == family::os2);
  CHECK(resolve_family(make_snapshot("netware", "x86", "5.70", ";")) == family::netware);
  CHECK(resolve_family(make_snapshot("openvms", "ia64", "v8.4", ":")) == family::openvms);
}

TEST_CASE("resolution is deterministic") {
  auto snap = make_snapshot("z/os", "s390x", "02.05.00", ":");
  auto first = resolve_family(snap);
  for (int i = 0; i < 16; ++i) {
    CHECK(resolve_family(snap) == first);
  }
}

TEST_CASE("hosts matching no family resolve to nothing") {
  CHECK_FALSE(resolve_family(make_snapshot("beos", "x86", "5", "")).has_value());
  CHECK_FALSE(resolve_family(make_snapshot("", "", "", "")).has_value());
}

TEST_CASE("current family is computed once") {
  const auto& first = h0st::current_family_id();
  const auto& second = h0st::current_family_id();
  CHECK(&first == &second);
  CHECK(first == resolve_family(h0st::current_snapshot()));
}
