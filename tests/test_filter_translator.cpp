#include "docvec/core/errors.h"
#include "docvec/filter/filter_translator.h"

#include "store_fixtures.h"

#include <catch2/catch.hpp>

using namespace docvec;
using namespace docvec::filter;
using nlohmann::json;

namespace {

schema::RowSchema row_schema() { return schema::build_row_schema(testing::article_schema(), 2); }

}  // namespace

TEST_CASE("FilterTranslator: comparisons on scalar columns", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK(translator.translate(eq("meta.title", "Wales")) == R"("meta.title" = 'Wales')");
  CHECK(translator.translate(gt("page_number", 5)) == R"("meta.page_number" > 5)");
  CHECK(translator.translate(le("meta.rating", 4.5)) == R"("meta.rating" <= 4.5)");
  CHECK(translator.translate(eq("meta.draft", true)) == R"("meta.draft" = 1)");
  CHECK(translator.translate(eq("id", "doc-1")) == R"("id" = 'doc-1')");
  CHECK(translator.translate(eq("meta.source.url", "x")) == R"("meta.source.url" = 'x')");
}

TEST_CASE("FilterTranslator: inequality and null follow pipeline semantics", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK(translator.translate(ne("meta.title", "Wales")) == R"("meta.title" IS NOT 'Wales')");
  CHECK(translator.translate(eq("meta.title", nullptr)) == R"("meta.title" IS NULL)");
  CHECK(translator.translate(ne("meta.title", nullptr)) == R"("meta.title" IS NOT NULL)");
  CHECK(translator.translate(not_in("meta.page_number", json{1, 2})) ==
        R"(("meta.page_number" IS NULL OR "meta.page_number" NOT IN (1, 2)))");
  CHECK(translator.translate(in("meta.title", json{"a", "b"})) == R"("meta.title" IN ('a', 'b'))");
}

TEST_CASE("FilterTranslator: timestamps compare as instants", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK(translator.translate(ge("published", "2021-01-01")) ==
        R"(julianday("meta.published") >= julianday('2021-01-01'))");
  CHECK(translator.translate(lt("meta.published", "2021-01-01T08:30:00.25")) ==
        R"(julianday("meta.published") < julianday('2021-01-01T08:30:00.25'))");
  CHECK(translator.translate(eq("published", "2021-01-01T00:00:00")) ==
        R"(julianday("meta.published") = julianday('2021-01-01T00:00:00'))");
  CHECK(translator.translate(ne("published", "2021-01-01")) ==
        R"(julianday("meta.published") IS NOT julianday('2021-01-01'))");
  CHECK(translator.translate(eq("published", nullptr)) == R"("meta.published" IS NULL)");
  CHECK(translator.translate(in("published", json{"2021-01-01", "2022-01-01"})) ==
        R"(julianday("meta.published") IN (julianday('2021-01-01'), julianday('2022-01-01')))");
  CHECK(translator.translate(not_in("published", json{"2021-01-01"})) ==
        R"(("meta.published" IS NULL OR julianday("meta.published") NOT IN )"
        R"((julianday('2021-01-01'))))");
  CHECK_THROWS_AS(translator.translate(in("published", json{"2021-01-01", "soon"})),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(contains("published", "2021")),
                  core::UnsupportedFilterError);
}

TEST_CASE("FilterTranslator: contains on a list of timestamps", "[filter][translator]") {
  using schema::FieldType;
  const auto schema = schema::build_row_schema(
      schema::MetadataSchema({{"revisions", FieldType::list(FieldType::timestamp())}}), 2);
  const FilterTranslator translator(schema);

  CHECK(translator.translate(contains("revisions", "2021-01-01")) ==
        R"(EXISTS (SELECT 1 FROM json_each("meta.revisions") )"
        R"(WHERE julianday(json_each.value) = julianday('2021-01-01')))");
  CHECK_THROWS_AS(translator.translate(contains("revisions", "January")),
                  core::UnsupportedFilterError);
}

TEST_CASE("FilterTranslator: string literals are quoted", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK(translator.translate(eq("meta.title", "it's")) == R"("meta.title" = 'it''s')");
  CHECK(translator.translate(contains("content", "x'; DROP TABLE articles; --")) ==
        R"(instr("content", 'x''; DROP TABLE articles; --') > 0)");
}

TEST_CASE("FilterTranslator: contains on a list column", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK(translator.translate(contains("meta.topics", "history")) ==
        R"(EXISTS (SELECT 1 FROM json_each("meta.topics") WHERE json_each.value = 'history'))");
  CHECK(translator.translate(eq("meta.topics", nullptr)) == R"("meta.topics" IS NULL)");
  CHECK_THROWS_AS(translator.translate(eq("meta.topics", "history")), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(contains("meta.topics", 3)), core::UnsupportedFilterError);
}

TEST_CASE("FilterTranslator: logical operators nest with parentheses", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  const auto expr = logical_and({gt("meta.page_number", 5), contains("meta.topics", "history")});
  CHECK(translator.translate(expr) ==
        R"(("meta.page_number" > 5) AND (EXISTS (SELECT 1 FROM json_each("meta.topics") )"
        R"(WHERE json_each.value = 'history')))");

  CHECK(translator.translate(logical_or({eq("id", "a"), eq("id", "b")})) ==
        R"(("id" = 'a') OR ("id" = 'b'))");
  CHECK(translator.translate(logical_not({eq("id", "a")})) == R"(NOT ("id" = 'a'))");
  CHECK(translator.translate(logical_not({eq("id", "a"), eq("content", "b")})) ==
        R"(NOT (("id" = 'a') AND ("content" = 'b')))");
}

TEST_CASE("FilterTranslator: operator and type mismatches are rejected", "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK_THROWS_AS(translator.translate(gt("meta.title", "a")), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(gt("meta.draft", true)), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(in("meta.draft", json{true})), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(contains("meta.page_number", 1)),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(eq("meta.page_number", "five")),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(gt("meta.published", "last week")),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(in("meta.title", "a")), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(gt("meta.page_number", nullptr)),
                  core::UnsupportedFilterError);
}

TEST_CASE("FilterTranslator: unknown, embedding and struct fields are rejected",
          "[filter][translator]") {
  const auto schema = row_schema();
  const FilterTranslator translator(schema);

  CHECK_THROWS_AS(translator.translate(eq("meta.colour", "red")), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(eq("colour", "red")), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(eq("embedding", nullptr)), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(eq("meta.source", nullptr)), core::UnsupportedFilterError);
  CHECK_THROWS_AS(translator.translate(logical_and({})), core::UnsupportedFilterError);
}
