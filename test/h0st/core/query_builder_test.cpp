#include <doctest/doctest.h>

#include <string>

#include "h0st/core/classifier.hpp"
#include "h0st/core/query_builder.hpp"

namespace {

using h0st::make_snapshot;
using h0st::query_builder;

} // namespace

TEST_CASE("builder lowercases values as they are set") {
  auto built =
      query_builder().set_family("UNIX").set_name("Linux").set_arch("X86_64").set_version("6.8.0-Arch1").build();
  REQUIRE(built.ok());
  CHECK(*built.value.family == "unix");
  CHECK(*built.value.name == "linux");
  CHECK(*built.value.arch == "x86_64");
  CHECK(*built.value.version == "6.8.0-arch1");
}

TEST_CASE("an empty builder evaluates to false") {
  auto result = query_builder().evaluate(make_snapshot("linux", "x86_64", "6.8.0", ":"));
  REQUIRE(result.ok());
  CHECK_FALSE(result.value);
}

TEST_CASE("builder evaluation equals classification for every family") {
  auto snaps = {
      make_snapshot("windows 10", "amd64", "10.0", ";"), make_snapshot("darwin", "arm64", "23.4.0", ":"),
      make_snapshot("openvms", "ia64", "v8.4", ":"), make_snapshot("netware", "x86", "5.70", ";")
  };
  for (const auto& snap : snaps) {
    for (const auto& token : h0st::valid_families()) {
      auto evaluated = query_builder().set_family(token).evaluate(snap);
      auto classified = h0st::classify(token, snap);
      REQUIRE(evaluated.ok());
      REQUIRE(classified.ok());
      CHECK(evaluated.value == classified.value);
    }
  }
}

TEST_CASE("family constructor seeds the query") {
  query_builder builder("Mac");
  auto built = builder.build();
  REQUIRE(built.ok());
  CHECK(*built.value.family == "mac");
  CHECK_FALSE(built.value.name.has_value());
}

TEST_CASE("null values are reported as invalid arguments") {
  query_builder builder;
  builder.set_family("unix").set_name(static_cast<const char*>(nullptr)).set_arch(static_cast<const char*>(nullptr));

  auto built = builder.build();
  CHECK_FALSE(built.ok());
  CHECK(built.status_info.code == h0st::error_code::invalid_argument);
  CHECK(built.status_info.message.find("name") != std::string::npos);

  auto evaluated = builder.evaluate(make_snapshot("linux", "x86_64", "6.8.0", ":"));
  CHECK_FALSE(evaluated.ok());
  CHECK(evaluated.status_info.code == h0st::error_code::invalid_argument);
}

TEST_CASE("unknown families surface from evaluate") {
  auto evaluated = query_builder().set_family("amiga").evaluate(make_snapshot("linux", "x86_64", "6.8.0", ":"));
  CHECK_FALSE(evaluated.ok());
  CHECK(evaluated.status_info.code == h0st::error_code::unknown_family);
}

TEST_CASE("builders are independent values") {
  query_builder first;
  first.set_family("unix");
  query_builder second = first;
  second.set_name("freebsd");

  auto snap = make_snapshot("linux", "x86_64", "6.8.0", ":");
  CHECK(first.evaluate(snap).value);
  CHECK_FALSE(second.evaluate(snap).value);
}
