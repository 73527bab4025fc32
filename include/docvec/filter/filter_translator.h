#pragma once

#include "docvec/filter/filter_expr.h"
#include "docvec/schema/row_schema.h"

#include <string>
#include <string_view>

namespace docvec::filter {

// FilterTranslator renders a FilterExpr as a SQLite boolean expression over one
// table's columns. It is the only place filter values become SQL text: strings are
// quoted, numbers are printed in shortest round-trip form, and every column name
// is checked against the row schema before it is emitted. Timestamp operands on both
// sides are wrapped in julianday() so comparisons follow time, not spelling.
//
// Null semantics follow the pipeline's filters rather than SQL's:
//   field != v      matches rows where field is absent
//   field not in V  matches rows where field is absent
//   field == null   matches rows where field is absent
//
// Every failure is a core::UnsupportedFilterError naming the offending field.
class FilterTranslator {
 public:
  // The schema must outlive the translator.
  explicit FilterTranslator(const schema::RowSchema& schema) : schema_(schema) {}

  [[nodiscard]] std::string translate(const FilterExpr& expr) const;

  // Resolves a filter field name to its column. Throws for unknown fields, the
  // embedding column and struct fields.
  [[nodiscard]] const schema::Column& resolve_field(std::string_view field) const;

 private:
  [[nodiscard]] std::string translate_comparison(const FilterExpr::Comparison& comparison) const;
  [[nodiscard]] std::string translate_logical(const FilterExpr::Logical& logical) const;

  const schema::RowSchema& schema_;
};

}  // namespace docvec::filter
