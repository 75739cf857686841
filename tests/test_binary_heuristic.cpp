#include <catch2/catch.hpp>
#include "include/binary_heuristic.hpp"
#include <string>

TEST_CASE("utf8_length: counts code points", "[binary]") {
  REQUIRE(utf8_length("") == 0);
  REQUIRE(utf8_length("abc") == 3);
  REQUIRE(utf8_length("M\xc3\xbcller") == 6);
  REQUIRE(utf8_length("\xe2\x82\xac") == 1);
  REQUIRE(utf8_length("\xf0\x9f\x98\x80!") == 2);
}

TEST_CASE("utf8_length: invalid bytes count once each", "[binary]") {
  REQUIRE(utf8_length("\xff\xfe") == 2);
  REQUIRE(utf8_length("a\xc3") == 2);
}

TEST_CASE("is_binary_value: plain text is not binary", "[binary]") {
  REQUIRE_FALSE(is_binary_value(""));
  REQUIRE_FALSE(is_binary_value("Alice Smith"));
  REQUIRE_FALSE(is_binary_value("line one\nline two"));
  REQUIRE_FALSE(is_binary_value("J\xc3\xbcrgen"));
}

TEST_CASE("is_binary_value: control-heavy values", "[binary]") {
  REQUIRE(is_binary_value(std::string("\x01\x02\x03z", 4)));
  // 3 of 10 is not above the limit
  REQUIRE_FALSE(is_binary_value(std::string("\x01\x02\x03xxxxxxx", 10)));
  REQUIRE(is_binary_value(std::string("\x01\x02\x03\x04xxxxxx", 10)));
}

TEST_CASE("is_binary_value: C1 controls count when decoded", "[binary]") {
  // U+0085 encoded as C2 85
  REQUIRE(is_binary_value("\xc2\x85\xc2\x85z"));
  // Stray continuation bytes are not controls
  REQUIRE_FALSE(is_binary_value("\x85\x86zzzz"));
}

TEST_CASE("is_binary_value: long values are binary", "[binary]") {
  REQUIRE_FALSE(is_binary_value(std::string(1000, 'a')));
  REQUIRE(is_binary_value(std::string(1001, 'a')));
  REQUIRE(is_binary_value(std::string(1200, 'x')));
  REQUIRE_FALSE(is_binary_value("printable!"));
}
