#include <catch2/catch.hpp>
#include "include/csv_reader.hpp"
#include "include/mapped_file.hpp"
#include "test_helpers.hpp"
#include <string>

TEST_CASE("unquote: bare and quoted fields", "[csv_reader]") {
  REQUIRE(unquote("Engineering") == "Engineering");
  REQUIRE(unquote("\"$85,000\"") == "$85,000");
  REQUIRE(unquote("\"\"") == "");
  REQUIRE(unquote("") == "");
}

TEST_CASE("unquote: doubled quotes collapse", "[csv_reader]") {
  REQUIRE(unquote("\"He said \"\"hello\"\"\"") == "He said \"hello\"");
  REQUIRE(unquote("\"\"\"\"") == "\"");
}

TEST_CASE("unquote: unbalanced quote is left alone", "[csv_reader]") {
  REQUIRE(unquote("\"") == "\"");
  REQUIRE(unquote("\"open") == "\"open");
}

TEST_CASE("CsvReader: basic.csv header and rows", "[csv_reader]") {
  std::string text = read_fixture("basic.csv");
  CsvReader reader(text);
  reader.parse(',');

  REQUIRE(reader.size() == text.size());
  REQUIRE(reader.column_count() == 6);
  REQUIRE(reader.row_count() == 6);
  REQUIRE(reader.total_rows() == 6);
  REQUIRE(reader.headers()[0] == "name");
  REQUIRE(reader.headers()[5] == "department");

  auto alice = reader.row(0);
  REQUIRE(alice.size() == 6);
  REQUIRE(alice[0] == "Alice");
  REQUIRE(unquote(alice[2]) == "$85,000");
}

TEST_CASE("CsvReader: trailing empty field", "[csv_reader]") {
  std::string text = read_fixture("basic.csv");
  CsvReader reader(text);
  reader.parse(',');

  auto eve = reader.row(4);
  REQUIRE(eve[0] == "Eve");
  REQUIRE(eve[2].empty());
  REQUIRE(eve[5].empty());
}

TEST_CASE("CsvReader: parse_head counts the remaining rows",
          "[csv_reader]") {
  std::string text = read_fixture("basic.csv");
  CsvReader reader(text);
  reader.parse_head(',', 2);
  REQUIRE(reader.row_count() == 2);
  REQUIRE(reader.total_rows() == 6);
}

TEST_CASE("CsvReader: quoted newlines and escaped quotes", "[csv_reader]") {
  std::string text = read_fixture("quoted.csv");
  CsvReader reader(text);
  reader.parse(',');

  REQUIRE(reader.row_count() == 3);
  REQUIRE(unquote(reader.row(0)[0]) == "Smith, John");
  REQUIRE(unquote(reader.row(0)[1]) == "He said \"hello\"");
  REQUIRE(unquote(reader.row(1)[1]) == "Line one\nLine two");
  REQUIRE(reader.row(2)[2] == "30");
}

TEST_CASE("CsvReader: ragged rows are padded", "[csv_reader]") {
  std::string text = "a,b,c\n1\n1,2,3,4\n";
  CsvReader reader(text);
  reader.parse(',');

  REQUIRE(reader.row_count() == 2);
  REQUIRE(reader.row(0)[0] == "1");
  REQUIRE(reader.row(0)[1].empty());
  REQUIRE(reader.row(0)[2].empty());
  REQUIRE(reader.row(1)[2] == "3");
}

TEST_CASE("CsvReader: blank lines and CRLF", "[csv_reader]") {
  std::string text = "id;name\r\n\r\n1;Alice\r\n\r\n2;Bob\r\n";
  CsvReader reader(text);
  reader.parse(';');

  REQUIRE(reader.headers()[1] == "name");
  REQUIRE(reader.row_count() == 2);
  REQUIRE(reader.total_rows() == 2);
  REQUIRE(reader.row(1)[1] == "Bob");
}

TEST_CASE("CsvReader: empty text", "[csv_reader]") {
  CsvReader reader("");
  reader.parse(',');
  REQUIRE(reader.column_count() == 0);
  REQUIRE(reader.row_count() == 0);
}

TEST_CASE("MappedFile: reads a whole file", "[csv_reader]") {
  TempFile tmp("id,name\n1,Alice\n");
  MappedFile file(tmp.path());
  REQUIRE(file.size() == 16);
  REQUIRE(file.view() == "id,name\n1,Alice\n");
}

TEST_CASE("MappedFile: missing file throws", "[csv_reader]") {
  REQUIRE_THROWS_AS(MappedFile("/nonexistent/schemasniff.csv"),
                    std::runtime_error);
}
