#include "docvec/filter/filter_translator.h"

#include "docvec/core/errors.h"
#include "docvec/schema/timestamp.h"
#include "docvec/storage/sqlite/sql_text.h"

#include <cmath>

namespace docvec::filter {

using core::UnsupportedFilterError;
using nlohmann::json;
using schema::Column;
using schema::ColumnKind;
using schema::FieldKind;
using storage::sqlite::quote_identifier;
using storage::sqlite::quote_string_literal;

namespace {

// ValueClass is the literal type a column compares against.
enum class ValueClass : uint8_t { kString, kTimestamp, kNumber, kBoolean };

[[noreturn]] void unsupported(const Column& column, ComparisonOp op, const std::string& detail) {
  throw UnsupportedFilterError("filter on '" + column.name + "' with '" +
                               std::string(to_string(op)) + "': " + detail);
}

ValueClass value_class_of(FieldKind kind) {
  switch (kind) {
    case FieldKind::kBool:
      return ValueClass::kBoolean;
    case FieldKind::kInt32:
    case FieldKind::kInt64:
    case FieldKind::kFloat:
    case FieldKind::kDouble:
      return ValueClass::kNumber;
    case FieldKind::kTimestamp:
      return ValueClass::kTimestamp;
    case FieldKind::kString:
    case FieldKind::kList:
    case FieldKind::kStruct:
      break;
  }
  return ValueClass::kString;
}

ValueClass value_class_of(const Column& column) {
  switch (column.kind) {
    case ColumnKind::kInteger:
    case ColumnKind::kReal:
      return ValueClass::kNumber;
    case ColumnKind::kBoolean:
      return ValueClass::kBoolean;
    case ColumnKind::kTimestamp:
      return ValueClass::kTimestamp;
    case ColumnKind::kText:
    case ColumnKind::kJson:
    case ColumnKind::kStructMarker:
    case ColumnKind::kEmbedding:
      break;
  }
  return ValueClass::kString;
}

std::string_view describe(ValueClass value_class) {
  switch (value_class) {
    case ValueClass::kString:
      return "a string";
    case ValueClass::kTimestamp:
      return "an ISO-8601 timestamp string";
    case ValueClass::kNumber:
      return "a finite number";
    case ValueClass::kBoolean:
      return "a boolean";
  }
  return "a value";  // unreachable
}

// render_literal checks that value matches value_class and renders it as SQL.
// Timestamps render as julianday() so that equal instants written differently compare
// equal. Returns an empty string when it does not match.
std::string render_literal(const json& value, ValueClass value_class) {
  switch (value_class) {
    case ValueClass::kString:
      if (value.is_string()) {
        return quote_string_literal(value.get<std::string>());
      }
      break;
    case ValueClass::kTimestamp:
      if (value.is_string() && schema::is_iso8601_timestamp(value.get<std::string>())) {
        return "julianday(" + quote_string_literal(value.get<std::string>()) + ")";
      }
      break;
    case ValueClass::kNumber:
      if (value.is_number_integer()) {
        return value.dump();
      }
      if (value.is_number_float() && std::isfinite(value.get<double>())) {
        return value.dump();
      }
      break;
    case ValueClass::kBoolean:
      if (value.is_boolean()) {
        return value.get<bool>() ? "1" : "0";
      }
      break;
  }
  return {};
}

std::string literal_for(const Column& column, ComparisonOp op, const json& value,
                        ValueClass value_class) {
  std::string literal = render_literal(value, value_class);
  if (literal.empty()) {
    unsupported(column, op,
                "expected " + std::string(describe(value_class)) + ", got " + value.dump());
  }
  return literal;
}

std::string literal_list(const Column& column, ComparisonOp op, const json& values,
                         ValueClass value_class) {
  if (!values.is_array()) {
    unsupported(column, op, "expected an array of values, got " + values.dump());
  }
  std::string out = "(";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += literal_for(column, op, values[i], value_class);
  }
  out += ")";
  return out;
}

// operand is the column side of a comparison, in the same domain as render_literal.
std::string operand(const std::string& expr, ValueClass value_class) {
  return value_class == ValueClass::kTimestamp ? "julianday(" + expr + ")" : expr;
}

bool allowed(ValueClass value_class, ComparisonOp op) {
  switch (op) {
    case ComparisonOp::kEq:
    case ComparisonOp::kNe:
      return true;
    case ComparisonOp::kLt:
    case ComparisonOp::kLe:
    case ComparisonOp::kGt:
    case ComparisonOp::kGe:
      return value_class == ValueClass::kNumber || value_class == ValueClass::kTimestamp;
    case ComparisonOp::kIn:
    case ComparisonOp::kNotIn:
      return value_class != ValueClass::kBoolean;
    case ComparisonOp::kContains:
      return value_class == ValueClass::kString;
  }
  return false;
}

std::string_view sql_operator(ComparisonOp op) {
  switch (op) {
    case ComparisonOp::kEq:
      return "=";
    case ComparisonOp::kNe:
      return "IS NOT";
    case ComparisonOp::kLt:
      return "<";
    case ComparisonOp::kLe:
      return "<=";
    case ComparisonOp::kGt:
      return ">";
    case ComparisonOp::kGe:
      return ">=";
    case ComparisonOp::kIn:
    case ComparisonOp::kNotIn:
    case ComparisonOp::kContains:
      break;
  }
  return "=";  // callers handle the set and containment operators themselves
}

std::string translate_list_comparison(const Column& column, ComparisonOp op, const json& value) {
  const std::string name = quote_identifier(column.name);

  if (value.is_null() && (op == ComparisonOp::kEq || op == ComparisonOp::kNe)) {
    return name + (op == ComparisonOp::kEq ? " IS NULL" : " IS NOT NULL");
  }
  if (op != ComparisonOp::kContains) {
    unsupported(column, op, "list fields support only 'contains', '== null' and '!= null'");
  }

  const schema::FieldType& element = column.type->element();
  if (!element.is_primitive()) {
    unsupported(column, op, "'contains' needs a list of primitive values");
  }
  const ValueClass element_class = value_class_of(element.kind());
  const std::string literal = literal_for(column, op, value, element_class);
  return "EXISTS (SELECT 1 FROM json_each(" + name + ") WHERE " +
         operand("json_each.value", element_class) + " = " + literal + ")";
}

}  // namespace

const Column& FilterTranslator::resolve_field(std::string_view field) const {
  std::string column_name;
  if (field == schema::kIdColumn || field == schema::kContentColumn ||
      field == schema::kEmbeddingColumn || field.rfind(schema::kMetaPrefix, 0) == 0) {
    column_name = std::string(field);
  } else {
    column_name = std::string(schema::kMetaPrefix) + std::string(field);
  }

  const Column* column = schema_.find_column(column_name);
  if (column == nullptr) {
    throw UnsupportedFilterError("unknown filter field '" + std::string(field) + "'");
  }
  if (column->kind == ColumnKind::kEmbedding) {
    throw UnsupportedFilterError("cannot filter on the embedding field");
  }
  if (column->kind == ColumnKind::kStructMarker) {
    throw UnsupportedFilterError("cannot filter on struct field '" + std::string(field) +
                                 "'; name one of its leaves");
  }
  return *column;
}

std::string FilterTranslator::translate(const FilterExpr& expr) const {
  if (const auto* comparison = std::get_if<FilterExpr::Comparison>(&expr.node)) {
    return translate_comparison(*comparison);
  }
  return translate_logical(std::get<FilterExpr::Logical>(expr.node));
}

std::string FilterTranslator::translate_comparison(const FilterExpr::Comparison& comparison) const {
  const Column& column = resolve_field(comparison.field);
  const ComparisonOp op = comparison.op;
  const json& value = comparison.value;

  if (column.kind == ColumnKind::kJson) {
    return translate_list_comparison(column, op, value);
  }

  const ValueClass value_class = value_class_of(column);
  if (!allowed(value_class, op)) {
    unsupported(column, op, "operator is not defined for this field type");
  }

  const std::string name = quote_identifier(column.name);
  const std::string lhs = operand(name, value_class);
  switch (op) {
    case ComparisonOp::kEq:
    case ComparisonOp::kNe:
      if (value.is_null()) {
        return name + (op == ComparisonOp::kEq ? " IS NULL" : " IS NOT NULL");
      }
      return lhs + " " + std::string(sql_operator(op)) + " " +
             literal_for(column, op, value, value_class);
    case ComparisonOp::kLt:
    case ComparisonOp::kLe:
    case ComparisonOp::kGt:
    case ComparisonOp::kGe:
      return lhs + " " + std::string(sql_operator(op)) + " " +
             literal_for(column, op, value, value_class);
    case ComparisonOp::kIn:
      return lhs + " IN " + literal_list(column, op, value, value_class);
    case ComparisonOp::kNotIn:
      return "(" + name + " IS NULL OR " + lhs + " NOT IN " +
             literal_list(column, op, value, value_class) + ")";
    case ComparisonOp::kContains:
      return "instr(" + name + ", " + literal_for(column, op, value, value_class) + ") > 0";
  }
  unsupported(column, op, "unknown operator");
}

std::string FilterTranslator::translate_logical(const FilterExpr::Logical& logical) const {
  if (logical.conditions.empty()) {
    throw UnsupportedFilterError("logical operator '" + std::string(to_string(logical.op)) +
                                 "' needs at least one condition");
  }

  const char* joiner = logical.op == LogicalOp::kOr ? " OR " : " AND ";
  std::string joined;
  for (std::size_t i = 0; i < logical.conditions.size(); ++i) {
    if (i > 0) {
      joined += joiner;
    }
    joined += "(" + translate(logical.conditions[i]) + ")";
  }

  if (logical.op == LogicalOp::kNot) {
    return logical.conditions.size() == 1 ? "NOT " + joined : "NOT (" + joined + ")";
  }
  return joined;
}

}  // namespace docvec::filter
