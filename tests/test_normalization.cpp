#include "docvec/core/normalization.h"

#include <catch2/catch.hpp>

using namespace docvec::core;

TEST_CASE("tokenize_words: splits on non-alphanumerics and lower-cases", "[core][normalization]") {
  const auto tokens = tokenize_words("Castles of WALES, vol.2");
  REQUIRE(tokens.size() == 5);
  CHECK(tokens[0] == "castles");
  CHECK(tokens[1] == "of");
  CHECK(tokens[2] == "wales");
  CHECK(tokens[3] == "vol");
  CHECK(tokens[4] == "2");
}

TEST_CASE("tokenize_words: UTF-8 sequences stay inside their word", "[core][normalization]") {
  const auto tokens = tokenize_words("Caf\xc3\xa9, \xc3\xa0 Paris");
  REQUIRE(tokens.size() == 3);
  CHECK(tokens[0] == "caf\xc3\xa9");
  CHECK(tokens[1] == "\xc3\xa0");
  CHECK(tokens[2] == "paris");
}

TEST_CASE("tokenize_words: non-ASCII bytes are not case-folded", "[core][normalization]") {
  const auto tokens = tokenize_words("CAF\xc3\x89");
  REQUIRE(tokens.size() == 1);
  CHECK(tokens[0] == "caf\xc3\x89");
}

TEST_CASE("tokenize_words: min_length drops short tokens", "[core][normalization]") {
  const auto tokens = tokenize_words("a bb ccc", 2);
  REQUIRE(tokens.size() == 2);
  CHECK(tokens[0] == "bb");
  CHECK(tokens[1] == "ccc");
}

TEST_CASE("tokenize_words: punctuation-only input yields no tokens", "[core][normalization]") {
  CHECK(tokenize_words("").empty());
  CHECK(tokenize_words("  ?!*  ").empty());
}

TEST_CASE("trim: removes surrounding ASCII whitespace only", "[core][normalization]") {
  CHECK(trim("  hello \r\n") == "hello");
  CHECK(trim("\t\t") == "");
  CHECK(trim("a b") == "a b");
}
