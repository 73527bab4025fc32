#include "docvec/filter/filter_expr.h"

namespace docvec::filter {

namespace {

struct OpName {
  ComparisonOp op;
  std::string_view name;
};

constexpr OpName kComparisonOps[] = {
    {ComparisonOp::kEq, "=="},      {ComparisonOp::kNe, "!="},
    {ComparisonOp::kLt, "<"},       {ComparisonOp::kLe, "<="},
    {ComparisonOp::kGt, ">"},       {ComparisonOp::kGe, ">="},
    {ComparisonOp::kIn, "in"},      {ComparisonOp::kNotIn, "not in"},
    {ComparisonOp::kContains, "contains"},
};

}  // namespace

std::optional<ComparisonOp> parse_comparison_op(std::string_view name) {
  for (const auto& entry : kComparisonOps) {
    if (entry.name == name) {
      return entry.op;
    }
  }
  return std::nullopt;
}

std::string_view to_string(ComparisonOp op) {
  for (const auto& entry : kComparisonOps) {
    if (entry.op == op) {
      return entry.name;
    }
  }
  return "==";  // unreachable
}

std::optional<LogicalOp> parse_logical_op(std::string_view name) {
  if (name == "AND") {
    return LogicalOp::kAnd;
  }
  if (name == "OR") {
    return LogicalOp::kOr;
  }
  if (name == "NOT") {
    return LogicalOp::kNot;
  }
  return std::nullopt;
}

std::string_view to_string(LogicalOp op) {
  switch (op) {
    case LogicalOp::kAnd:
      return "AND";
    case LogicalOp::kOr:
      return "OR";
    case LogicalOp::kNot:
      return "NOT";
  }
  return "AND";  // unreachable
}

bool operator==(const FilterExpr& a, const FilterExpr& b) {
  if (a.node.index() != b.node.index()) {
    return false;
  }
  if (const auto* ca = std::get_if<FilterExpr::Comparison>(&a.node)) {
    const auto& cb = std::get<FilterExpr::Comparison>(b.node);
    return ca->field == cb.field && ca->op == cb.op && ca->value == cb.value;
  }
  const auto& la = std::get<FilterExpr::Logical>(a.node);
  const auto& lb = std::get<FilterExpr::Logical>(b.node);
  return la.op == lb.op && la.conditions == lb.conditions;
}

FilterExpr compare(std::string field, ComparisonOp op, nlohmann::json value) {
  return FilterExpr{FilterExpr::Comparison{std::move(field), op, std::move(value)}};
}

FilterExpr eq(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kEq, std::move(value));
}

FilterExpr ne(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kNe, std::move(value));
}

FilterExpr lt(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kLt, std::move(value));
}

FilterExpr le(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kLe, std::move(value));
}

FilterExpr gt(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kGt, std::move(value));
}

FilterExpr ge(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kGe, std::move(value));
}

FilterExpr in(std::string field, nlohmann::json values) {
  return compare(std::move(field), ComparisonOp::kIn, std::move(values));
}

FilterExpr not_in(std::string field, nlohmann::json values) {
  return compare(std::move(field), ComparisonOp::kNotIn, std::move(values));
}

FilterExpr contains(std::string field, nlohmann::json value) {
  return compare(std::move(field), ComparisonOp::kContains, std::move(value));
}

FilterExpr logical_and(std::vector<FilterExpr> conditions) {
  return FilterExpr{FilterExpr::Logical{LogicalOp::kAnd, std::move(conditions)}};
}

FilterExpr logical_or(std::vector<FilterExpr> conditions) {
  return FilterExpr{FilterExpr::Logical{LogicalOp::kOr, std::move(conditions)}};
}

FilterExpr logical_not(std::vector<FilterExpr> conditions) {
  return FilterExpr{FilterExpr::Logical{LogicalOp::kNot, std::move(conditions)}};
}

}  // namespace docvec::filter
