#pragma once

#include "docvec/domain/document.h"
#include "docvec/schema/row_schema.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docvec::schema {

// Cell is one stored value. monostate is SQL NULL.
using Cell = std::variant<std::monostate, std::int64_t, double, std::string, domain::Embedding>;

// Row holds one cell per RowSchema column, in column order.
struct Row {
  std::vector<Cell> cells;
};

// UnknownFieldPolicy decides what happens to metadata keys the schema does not declare.
enum class UnknownFieldPolicy : uint8_t {
  kReject,  // throw SchemaMismatch (default)
  kDrop,    // silently discard the key
};

[[nodiscard]] std::optional<UnknownFieldPolicy> parse_unknown_field_policy(std::string_view name);
[[nodiscard]] std::string_view to_string(UnknownFieldPolicy policy);

// to_row flattens a document into the table's column layout.
//
// Metadata rules:
// - A missing key or a JSON null is an absent value (NULL column, or NULL marker
//   plus NULL children for structs).
// - Integers must fit the declared width; float/double accept any finite number.
// - Timestamps must be ISO-8601 strings (see timestamp.h).
// - Lists are validated element by element and stored as compact JSON.
//
// Throws core::SchemaMismatch when the id is empty, the embedding length differs from
// the table's dims, meta is not an object, or a value does not fit its declared type.
[[nodiscard]] Row to_row(const domain::Document& doc, const RowSchema& schema,
                         UnknownFieldPolicy unknown_fields = UnknownFieldPolicy::kReject);

// from_row rebuilds a document. Absent metadata values are omitted from meta.
// from_row(to_row(d)) == d for every document that conforms to the schema and
// carries no explicit nulls.
//
// Throws core::StorageError when a cell does not have the storage class its column
// requires (the table was modified outside this library).
[[nodiscard]] domain::Document from_row(const Row& row, const RowSchema& schema);

}  // namespace docvec::schema
