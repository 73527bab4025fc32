#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docvec::filter {

enum class ComparisonOp : uint8_t {
  kEq,
  kNe,
  kLt,
  kLe,
  kGt,
  kGe,
  kIn,
  kNotIn,
  kContains,
};

enum class LogicalOp : uint8_t {
  kAnd,
  kOr,
  kNot,  // negates the AND of its conditions
};

// Spellings follow the pipeline filter format: "==", "!=", "<", "<=", ">", ">=", "in",
// "not in", "contains" and "AND", "OR", "NOT".
[[nodiscard]] std::optional<ComparisonOp> parse_comparison_op(std::string_view name);
[[nodiscard]] std::string_view to_string(ComparisonOp op);
[[nodiscard]] std::optional<LogicalOp> parse_logical_op(std::string_view name);
[[nodiscard]] std::string_view to_string(LogicalOp op);

// FilterExpr is a value-semantic predicate tree over document fields.
// Leaves compare one field with a JSON literal; inner nodes combine conditions.
// Field names are "id", "content", "meta.<path>" or a bare "<path>" (read as meta.<path>).
struct FilterExpr {
  struct Comparison {
    std::string field;
    ComparisonOp op;      // NOLINT(readability-identifier-naming)
    nlohmann::json value;  // scalar, null, or array for in / not in
  };

  struct Logical {
    LogicalOp op;  // NOLINT(readability-identifier-naming)
    std::vector<FilterExpr> conditions;
  };

  std::variant<Comparison, Logical> node;
};

[[nodiscard]] bool operator==(const FilterExpr& a, const FilterExpr& b);

// Builders
[[nodiscard]] FilterExpr compare(std::string field, ComparisonOp op, nlohmann::json value);
[[nodiscard]] FilterExpr eq(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr ne(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr lt(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr le(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr gt(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr ge(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr in(std::string field, nlohmann::json values);
[[nodiscard]] FilterExpr not_in(std::string field, nlohmann::json values);
[[nodiscard]] FilterExpr contains(std::string field, nlohmann::json value);
[[nodiscard]] FilterExpr logical_and(std::vector<FilterExpr> conditions);
[[nodiscard]] FilterExpr logical_or(std::vector<FilterExpr> conditions);
[[nodiscard]] FilterExpr logical_not(std::vector<FilterExpr> conditions);

}  // namespace docvec::filter
