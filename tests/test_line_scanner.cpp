#include <catch2/catch.hpp>
#include "include/line_scanner.hpp"
#include <string>

TEST_CASE("LineScanner: splits on newlines", "[line_scanner]") {
  LineScanner lines("dn: a\ncn: b\nsn: c");
  REQUIRE(lines.size() == 3);
  REQUIRE(lines.line(0).text == "dn: a");
  REQUIRE(lines.line(1).text == "cn: b");
  REQUIRE(lines.line(2).text == "sn: c");
  REQUIRE(lines.line(2).index == 2);
}

TEST_CASE("LineScanner: trailing newline yields an empty last line",
          "[line_scanner]") {
  LineScanner lines("a\n");
  REQUIRE(lines.size() == 2);
  REQUIRE(lines.line(0).text == "a");
  REQUIRE(lines.line(1).text.empty());
  REQUIRE(lines.line(1).skippable);
}

TEST_CASE("LineScanner: empty content is one empty line", "[line_scanner]") {
  LineScanner lines("");
  REQUIRE(lines.size() == 1);
  REQUIRE(lines.line(0).text.empty());
}

TEST_CASE("LineScanner: carriage returns stay in the line text",
          "[line_scanner]") {
  LineScanner lines("a\r\nb\r\n");
  REQUIRE(lines.line(0).text == "a\r");
  REQUIRE(lines.line(1).text == "b\r");
}

TEST_CASE("LineScanner: blank and comment lines are skippable",
          "[line_scanner]") {
  LineScanner lines("# comment\n   \n\t\r\ncn: a\n #not a comment\n");
  REQUIRE(lines.line(0).skippable);
  REQUIRE(lines.line(1).skippable);
  REQUIRE(lines.line(2).skippable);
  REQUIRE_FALSE(lines.line(3).skippable);
  REQUIRE_FALSE(lines.line(4).skippable);
}

TEST_CASE("starts_with_continuation: single leading space",
          "[line_scanner]") {
  REQUIRE(starts_with_continuation(" abc"));
  REQUIRE(starts_with_continuation("  abc"));
  REQUIRE_FALSE(starts_with_continuation("abc"));
  REQUIRE_FALSE(starts_with_continuation("\tabc"));
  REQUIRE_FALSE(starts_with_continuation(""));
}

TEST_CASE("validate_utf8: accepts valid text", "[line_scanner]") {
  REQUIRE_NOTHROW(validate_utf8(""));
  REQUIRE_NOTHROW(validate_utf8("plain ascii\n"));
  REQUIRE_NOTHROW(validate_utf8("cn: J\xc3\xbcrgen M\xc3\xbcller"));
  REQUIRE_NOTHROW(validate_utf8("\xe2\x82\xac 100"));
  REQUIRE_NOTHROW(validate_utf8("\xf0\x9f\x98\x80"));
}

TEST_CASE("validate_utf8: rejects malformed sequences", "[line_scanner]") {
  REQUIRE_THROWS_AS(validate_utf8("\xff"), MalformedInput);
  REQUIRE_THROWS_AS(validate_utf8("\x80"), MalformedInput);
  REQUIRE_THROWS_AS(validate_utf8("abc\xc3"), MalformedInput);
  REQUIRE_THROWS_AS(validate_utf8("\xc3\x28"), MalformedInput);
  REQUIRE_THROWS_AS(validate_utf8("\xc0\xaf"), MalformedInput);
  REQUIRE_THROWS_AS(validate_utf8("\xed\xa0\x80"), MalformedInput);
  REQUIRE_THROWS_AS(validate_utf8("\xf4\x90\x80\x80"), MalformedInput);
}

TEST_CASE("validate_utf8: reports the failing offset", "[line_scanner]") {
  try {
    validate_utf8("dn: cn=\xff");
    FAIL("expected MalformedInput");
  } catch (const MalformedInput &e) {
    REQUIRE(e.offset() == 7);
  }
}
