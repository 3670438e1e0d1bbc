#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace rt;

TEST_CASE("split keeps interior empty fields", "[StringUtils]") {
  auto parts = split("a\n\nb\n", '\n');

  REQUIRE(parts.size() == 3);
  REQUIRE(parts[0] == "a");
  REQUIRE(parts[1] == "");
  REQUIRE(parts[2] == "b");
}

TEST_CASE("replaceAll replaces all occurrences", "[StringUtils]") {
  std::string str = "hello world, hello universe, hello everyone";
  int count = replaceAll(str, "hello", "hi");

  REQUIRE(count == 3);
  REQUIRE(str == "hi world, hi universe, hi everyone");
}

TEST_CASE("replaceAll returns 0 for empty pattern", "[StringUtils]") {
  std::string str = "hello world";
  int count = replaceAll(str, "", "hi");

  REQUIRE(count == 0);
  REQUIRE(str == "hello world");
}

TEST_CASE("replaceAll handles overlapping replacement", "[StringUtils]") {
  std::string str = "xxx";
  int count = replaceAll(str, "x", "yx");

  REQUIRE(count == 3);
  REQUIRE(str == "yxyxyx");
}

TEST_CASE("trimWhitespace strips both ends", "[StringUtils]") {
  REQUIRE(trimWhitespace("  \r\nvalue \t") == "value");
  REQUIRE(trimWhitespace(" \n ") == "");
  REQUIRE(trimWhitespace("a b") == "a b");
}

TEST_CASE("shellQuote survives embedded single quotes", "[StringUtils]") {
  REQUIRE(shellQuote("plain") == "'plain'");
  REQUIRE(shellQuote("it's") == "'it'\\''s'");
}

TEST_CASE("genRandomAlphaNum uses lowercase alphanumerics", "[StringUtils]") {
  string id = genRandomAlphaNum(64);

  REQUIRE(id.length() == 64);
  for (char c : id) {
    REQUIRE((isdigit((unsigned char)c) || (c >= 'a' && c <= 'z')));
  }
  REQUIRE(genRandomAlphaNum(12) != genRandomAlphaNum(12));
}
