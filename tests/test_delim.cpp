#include <catch2/catch.hpp>
#include "include/delim.hpp"
#include "test_helpers.hpp"
#include <string>

TEST_CASE("detect_delimiter: fixtures", "[delim]") {
  REQUIRE(detect_delimiter(read_fixture("basic.csv")) == ',');
  REQUIRE(detect_delimiter(read_fixture("quoted.csv")) == ',');
  REQUIRE(detect_delimiter(read_fixture("tabs.tsv")) == '\t');
  REQUIRE(detect_delimiter(read_fixture("pipes.csv")) == '|');
}

TEST_CASE("detect_delimiter: decimal commas lose to semicolons", "[delim]") {
  REQUIRE(detect_delimiter(read_fixture("semicolons.csv")) == ';');
}

TEST_CASE("detect_delimiter: no candidate falls back to comma", "[delim]") {
  REQUIRE(detect_delimiter("") == ',');
  REQUIRE(detect_delimiter("one\ntwo\nthree\n") == ',');
}

TEST_CASE("detect_delimiter: quoted candidates are ignored", "[delim]") {
  REQUIRE(detect_delimiter("a|b|c\n\"x,y,z,w\"|d|e\n1|2|3\n") == '|');
}

TEST_CASE("detect_delimiter: only the sampled lines count", "[delim]") {
  std::string content = "a\tb\tc\n1\t2\t3\n4\t5\t6\n";
  for (int i = 0; i < 10; ++i)
    content += "w,x,y,z\n";
  REQUIRE(detect_delimiter(content, 3) == '\t');
}
