#include "docvec/filter/filter_json.h"

#include "docvec/core/errors.h"

namespace docvec::filter {

using core::UnsupportedFilterError;

FilterExpr filter_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw UnsupportedFilterError("filter must be a JSON object, got " + j.dump());
  }
  if (!j.contains("operator") || !j["operator"].is_string()) {
    throw UnsupportedFilterError("filter is missing a string 'operator': " + j.dump());
  }
  const auto op_name = j["operator"].get<std::string>();

  if (j.contains("conditions")) {
    const auto logical = parse_logical_op(op_name);
    if (!logical) {
      throw UnsupportedFilterError("unknown logical operator '" + op_name + "'");
    }
    const auto& conditions = j["conditions"];
    if (!conditions.is_array()) {
      throw UnsupportedFilterError("'conditions' must be an array");
    }
    std::vector<FilterExpr> children;
    children.reserve(conditions.size());
    for (const auto& condition : conditions) {
      children.push_back(filter_from_json(condition));
    }
    return FilterExpr{FilterExpr::Logical{*logical, std::move(children)}};
  }

  const auto comparison = parse_comparison_op(op_name);
  if (!comparison) {
    throw UnsupportedFilterError("unknown comparison operator '" + op_name + "'");
  }
  if (!j.contains("field") || !j["field"].is_string()) {
    throw UnsupportedFilterError("comparison is missing a string 'field': " + j.dump());
  }
  if (!j.contains("value")) {
    throw UnsupportedFilterError("comparison is missing 'value': " + j.dump());
  }
  return compare(j["field"].get<std::string>(), *comparison, j["value"]);
}

nlohmann::json filter_to_json(const FilterExpr& expr) {
  if (const auto* comparison = std::get_if<FilterExpr::Comparison>(&expr.node)) {
    return nlohmann::json{{"field", comparison->field},
                          {"operator", std::string(to_string(comparison->op))},
                          {"value", comparison->value}};
  }

  const auto& logical = std::get<FilterExpr::Logical>(expr.node);
  nlohmann::json conditions = nlohmann::json::array();
  for (const auto& condition : logical.conditions) {
    conditions.push_back(filter_to_json(condition));
  }
  return nlohmann::json{{"operator", std::string(to_string(logical.op))},
                        {"conditions", std::move(conditions)}};
}

}  // namespace docvec::filter
