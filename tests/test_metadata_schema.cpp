#include "docvec/schema/metadata_schema.h"
#include "docvec/schema/row_schema.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace docvec::schema;
using nlohmann::json;

namespace {

MetadataSchema nested_schema() {
  return MetadataSchema({
      {"page", FieldType::int32()},
      {"source", FieldType::structure({{"url", FieldType::string()},
                                       {"origin", FieldType::structure({
                                                      {"country", FieldType::string()},
                                                  })}})},
      {"tags", FieldType::list(FieldType::string())},
  });
}

}  // namespace

TEST_CASE("parse_field_kind: known spellings round-trip", "[schema][field_type]") {
  for (auto kind : {FieldKind::kBool, FieldKind::kInt32, FieldKind::kInt64, FieldKind::kFloat,
                    FieldKind::kDouble, FieldKind::kString, FieldKind::kTimestamp,
                    FieldKind::kList, FieldKind::kStruct}) {
    const auto parsed = parse_field_kind(to_string(kind));
    REQUIRE(parsed.has_value());
    CHECK(parsed.value() == kind);
  }
  CHECK_FALSE(parse_field_kind("Int32").has_value());
  CHECK_FALSE(parse_field_kind("float32").has_value());
}

TEST_CASE("FieldType: describe renders nested types", "[schema][field_type]") {
  const auto type = FieldType::list(FieldType::structure({{"a", FieldType::int32()}}));
  CHECK(type.describe() == "list<struct{a: int32}>");
  CHECK_THROWS_AS(FieldType::int32().element(), std::logic_error);
  CHECK_THROWS_AS(FieldType::string().fields(), std::logic_error);
}

TEST_CASE("MetadataSchema: rejects invalid and duplicate field names", "[schema][metadata_schema]") {
  CHECK_THROWS_AS(MetadataSchema({{"", FieldType::string()}}), std::invalid_argument);
  CHECK_THROWS_AS(MetadataSchema({{"_hidden", FieldType::string()}}), std::invalid_argument);
  CHECK_THROWS_AS(MetadataSchema({{"with.dot", FieldType::string()}}), std::invalid_argument);
  CHECK_THROWS_AS(MetadataSchema({{"a", FieldType::string()}, {"a", FieldType::int32()}}),
                  std::invalid_argument);
  CHECK_THROWS_AS(
      MetadataSchema({{"s", FieldType::structure({{"bad name", FieldType::string()}})}}),
      std::invalid_argument);
}

TEST_CASE("MetadataSchema: find resolves dotted paths", "[schema][metadata_schema]") {
  const auto schema = nested_schema();

  REQUIRE(schema.find("page") != nullptr);
  CHECK(schema.find("page")->kind() == FieldKind::kInt32);
  REQUIRE(schema.find("source.origin.country") != nullptr);
  CHECK(schema.find("source.origin.country")->kind() == FieldKind::kString);
  CHECK(schema.find("source.missing") == nullptr);
  CHECK(schema.find("page.inner") == nullptr);
  CHECK(schema.find("") == nullptr);
}

TEST_CASE("schema_from_json: parses lists and structs", "[schema][metadata_schema]") {
  const json j = json::parse(R"({"fields": [
    {"name": "page", "type": "int32"},
    {"name": "topics", "type": "list", "element": {"type": "string"}},
    {"name": "source", "type": "struct", "children": [{"name": "url", "type": "string"}]}
  ]})");

  const auto schema = schema_from_json(j);
  REQUIRE(schema.fields().size() == 3);
  CHECK(schema.fields()[1].type.element().kind() == FieldKind::kString);
  CHECK(schema.fields()[2].type.fields()[0].name == "url");
  CHECK(schema_from_json(schema_to_json(schema)) == schema);
}

TEST_CASE("schema_from_json: malformed input throws", "[schema][metadata_schema]") {
  CHECK_THROWS_AS(schema_from_json(json::object()), std::invalid_argument);
  CHECK_THROWS_AS(schema_from_json(json::parse(R"({"fields": [{"name": "x", "type": "uuid"}]})")),
                  std::invalid_argument);
  CHECK_THROWS_AS(schema_from_json(json::parse(R"({"fields": [{"name": "x", "type": "list"}]})")),
                  std::invalid_argument);
  CHECK_THROWS_AS(schema_from_json(json::parse(R"({"fields": [{"type": "string"}]})")),
                  std::invalid_argument);
}

TEST_CASE("RowSchema: system columns first, then metadata depth first", "[schema][row_schema]") {
  const RowSchema row_schema(nested_schema(), 4);
  const auto& columns = row_schema.columns();

  REQUIRE(columns.size() == 9);
  CHECK(columns[0].name == "id");
  CHECK(columns[1].name == "content");
  CHECK(columns[2].name == "embedding");
  CHECK(columns[2].kind == ColumnKind::kEmbedding);
  CHECK(columns[3].name == "meta.page");
  CHECK(columns[4].name == "meta.source");
  CHECK(columns[4].kind == ColumnKind::kStructMarker);
  CHECK(columns[5].name == "meta.source.url");
  CHECK(columns[6].name == "meta.source.origin");
  CHECK(columns[7].name == "meta.source.origin.country");
  CHECK(columns[8].name == "meta.tags");
  CHECK(columns[8].meta_path == std::vector<std::string>{"tags"});
  CHECK_FALSE(columns[0].is_metadata());
}

TEST_CASE("RowSchema: lists become one JSON column", "[schema][row_schema]") {
  const RowSchema row_schema(nested_schema(), 4);
  const auto index = row_schema.column_index("meta.tags");
  REQUIRE(index.has_value());
  CHECK(row_schema.columns()[*index].kind == ColumnKind::kJson);
  CHECK(sql_type(ColumnKind::kJson) == "TEXT");
}

TEST_CASE("RowSchema: zero embedding dims is rejected", "[schema][row_schema]") {
  CHECK_THROWS_AS(RowSchema(nested_schema(), 0), std::invalid_argument);
}

TEST_CASE("RowSchema: JSON form round-trips and compares equal", "[schema][row_schema]") {
  const RowSchema row_schema(nested_schema(), 4);
  const auto restored = row_schema_from_json(row_schema.to_json());
  CHECK(restored == row_schema);
  CHECK(restored.columns().size() == row_schema.columns().size());
  CHECK_FALSE(RowSchema(nested_schema(), 8) == row_schema);
}
