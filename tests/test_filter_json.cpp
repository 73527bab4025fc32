#include "docvec/core/errors.h"
#include "docvec/filter/filter_expr.h"
#include "docvec/filter/filter_json.h"

#include <catch2/catch.hpp>

using namespace docvec;
using namespace docvec::filter;
using nlohmann::json;

TEST_CASE("parse_comparison_op: pipeline spellings", "[filter][filter_expr]") {
  CHECK(parse_comparison_op("==") == std::optional{ComparisonOp::kEq});
  CHECK(parse_comparison_op("!=") == std::optional{ComparisonOp::kNe});
  CHECK(parse_comparison_op("<=") == std::optional{ComparisonOp::kLe});
  CHECK(parse_comparison_op("not in") == std::optional{ComparisonOp::kNotIn});
  CHECK(parse_comparison_op("contains") == std::optional{ComparisonOp::kContains});
  CHECK_FALSE(parse_comparison_op("=").has_value());
  CHECK_FALSE(parse_comparison_op("IN").has_value());

  CHECK(parse_logical_op("AND") == std::optional{LogicalOp::kAnd});
  CHECK(parse_logical_op("NOT") == std::optional{LogicalOp::kNot});
  CHECK_FALSE(parse_logical_op("and").has_value());
}

TEST_CASE("filter_from_json: comparison leaf", "[filter][filter_json]") {
  const auto expr =
      filter_from_json(json{{"field", "meta.page_number"}, {"operator", ">"}, {"value", 5}});
  CHECK(expr == gt("meta.page_number", 5));
}

TEST_CASE("filter_from_json: nested logical tree", "[filter][filter_json]") {
  const json j = json::parse(R"({
    "operator": "AND",
    "conditions": [
      {"field": "meta.page_number", "operator": ">", "value": 5},
      {"operator": "OR", "conditions": [
        {"field": "meta.topics", "operator": "contains", "value": "history"},
        {"field": "meta.title", "operator": "in", "value": ["a", "b"]}
      ]}
    ]
  })");

  const auto expected = logical_and({
      gt("meta.page_number", 5),
      logical_or({contains("meta.topics", "history"), in("meta.title", json{"a", "b"})}),
  });
  CHECK(filter_from_json(j) == expected);
  CHECK(filter_to_json(expected) == j);
}

TEST_CASE("filter_from_json: null value is kept as a literal", "[filter][filter_json]") {
  const auto expr =
      filter_from_json(json{{"field", "meta.title"}, {"operator", "=="}, {"value", nullptr}});
  const auto& comparison = std::get<FilterExpr::Comparison>(expr.node);
  CHECK(comparison.value.is_null());
}

TEST_CASE("filter_from_json: malformed filters are unsupported", "[filter][filter_json]") {
  CHECK_THROWS_AS(filter_from_json(json::array()), core::UnsupportedFilterError);
  CHECK_THROWS_AS(filter_from_json(json{{"field", "a"}, {"value", 1}}),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(filter_from_json(json{{"field", "a"}, {"operator", "~="}, {"value", 1}}),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(filter_from_json(json{{"operator", "=="}, {"value", 1}}),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(filter_from_json(json{{"field", "a"}, {"operator", "=="}}),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(filter_from_json(json{{"operator", "XOR"}, {"conditions", json::array()}}),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(filter_from_json(json{{"operator", "AND"}, {"conditions", "x"}}),
                  core::UnsupportedFilterError);
}
