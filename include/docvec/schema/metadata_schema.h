#pragma once

#include "docvec/schema/field_type.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace docvec::schema {

// MetadataSchema is the caller-declared shape of document metadata, fixed when a
// table is created. It is the root struct of the metadata tree.
//
// Field names must be non-empty, use only [A-Za-z0-9_], must not start with '_' and
// must be unique among their siblings. The constructor enforces this recursively and
// throws std::invalid_argument otherwise.
class MetadataSchema {
 public:
  MetadataSchema() = default;
  explicit MetadataSchema(std::vector<MetadataField> fields);

  [[nodiscard]] const std::vector<MetadataField>& fields() const { return fields_; }
  [[nodiscard]] bool empty() const { return fields_.empty(); }

  // Resolves a dotted path such as "source.page" to its declared type.
  // Returns nullptr when any segment is unknown or crosses a non-struct field.
  [[nodiscard]] const FieldType* find(std::string_view dotted_path) const;

  // The schema viewed as a single struct type.
  [[nodiscard]] FieldType as_struct() const { return FieldType::structure(fields_); }

  friend bool operator==(const MetadataSchema& a, const MetadataSchema& b) {
    return a.fields_ == b.fields_;
  }

 private:
  std::vector<MetadataField> fields_;
};

// is_valid_field_name reports whether name is acceptable as a metadata field name.
[[nodiscard]] bool is_valid_field_name(std::string_view name);

// JSON form:
//   {"fields": [
//     {"name": "page", "type": "int32"},
//     {"name": "topics", "type": "list", "element": {"type": "string"}},
//     {"name": "source", "type": "struct", "children": [{"name": "url", "type": "string"}]}
//   ]}
[[nodiscard]] nlohmann::json field_type_to_json(const FieldType& type);
[[nodiscard]] nlohmann::json schema_to_json(const MetadataSchema& schema);

// Throws std::invalid_argument on unknown type names, missing keys or invalid field names.
[[nodiscard]] FieldType field_type_from_json(const nlohmann::json& j);
[[nodiscard]] MetadataSchema schema_from_json(const nlohmann::json& j);

}  // namespace docvec::schema
