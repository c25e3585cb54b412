// NOLINTBEGIN(misc-include-cleaner)
#include <catch2/catch.hpp>
#include <kb_bridge/text.hpp>
#include <string>
#include <vector>
// NOLINTEND(misc-include-cleaner)

TEST_CASE("truncate_utf8 counts code points", "[text]")
{
  REQUIRE(kb_bridge::truncate_utf8("hello", 10) == "hello");
  REQUIRE(kb_bridge::truncate_utf8("hello", 5) == "hello");
  REQUIRE(kb_bridge::truncate_utf8("hello", 3) == "hel");
  REQUIRE(kb_bridge::truncate_utf8("hello", 0).empty());
  REQUIRE(kb_bridge::truncate_utf8("", 3).empty());

  // Two-, three- and four-byte sequences stay whole
  const std::string mixed = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x8D\xB5z"; // aé€🍵z
  REQUIRE(kb_bridge::truncate_utf8(mixed, 1) == "a");
  REQUIRE(kb_bridge::truncate_utf8(mixed, 2) == "a\xC3\xA9");
  REQUIRE(kb_bridge::truncate_utf8(mixed, 3) == "a\xC3\xA9\xE2\x82\xAC");
  REQUIRE(kb_bridge::truncate_utf8(mixed, 4) == "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x8D\xB5");
  REQUIRE(kb_bridge::truncate_utf8(mixed, 5) == mixed);
}

TEST_CASE("join", "[text]")
{
  REQUIRE(kb_bridge::join({}, ", ").empty());
  REQUIRE(kb_bridge::join({ "one" }, ", ") == "one");
  REQUIRE(kb_bridge::join({ "one", "two", "three" }, ", ") == "one, two, three");
}
