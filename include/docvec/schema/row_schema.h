#pragma once

#include "docvec/schema/metadata_schema.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::schema {

constexpr const char* kIdColumn = "id";
constexpr const char* kContentColumn = "content";
constexpr const char* kEmbeddingColumn = "embedding";
// Every metadata column lives under this namespace so that user fields can never
// shadow the system columns.
constexpr const char* kMetaPrefix = "meta.";

// ColumnKind is the storage class of a flattened column.
enum class ColumnKind : uint8_t {
  kText,
  kInteger,
  kReal,
  kBoolean,       // INTEGER 0/1
  kTimestamp,     // TEXT, ISO-8601
  kJson,          // TEXT holding a JSON array (list fields)
  kStructMarker,  // INTEGER 1 when the struct is present, NULL otherwise
  kEmbedding,     // BLOB of float32 values
};

// SQL declared type for a column kind ("TEXT", "INTEGER", "REAL", "BLOB").
[[nodiscard]] std::string_view sql_type(ColumnKind kind);

struct Column {
  std::string name;                    // "id", "content", "embedding" or "meta.<path>"
  ColumnKind kind;                     // NOLINT(readability-identifier-naming)
  std::vector<std::string> meta_path;  // empty for system columns
  std::optional<FieldType> type;       // declared metadata type; nullopt for system columns

  [[nodiscard]] bool is_metadata() const { return !meta_path.empty(); }
};

// RowSchema is the flat column layout of one table: system columns first
// (id, content, embedding), then metadata columns in declaration order, depth first.
// A struct field contributes a presence marker column followed by its children;
// a list field contributes one JSON column.
//
// Immutable once built; a table keeps its RowSchema for its whole lifetime.
class RowSchema {
 public:
  // Throws std::invalid_argument when embedding_dims is zero.
  RowSchema(MetadataSchema metadata, std::size_t embedding_dims);

  [[nodiscard]] const std::vector<Column>& columns() const { return columns_; }
  [[nodiscard]] const MetadataSchema& metadata() const { return metadata_; }
  [[nodiscard]] std::size_t embedding_dims() const { return embedding_dims_; }

  [[nodiscard]] const Column* find_column(std::string_view name) const;
  [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;

  // {"embedding_dims": N, "metadata": <schema json>} Persisted in the table catalog.
  [[nodiscard]] nlohmann::json to_json() const;

  friend bool operator==(const RowSchema& a, const RowSchema& b) {
    return a.embedding_dims_ == b.embedding_dims_ && a.metadata_ == b.metadata_;
  }

 private:
  void add_metadata_columns(const std::vector<MetadataField>& fields,
                            const std::vector<std::string>& parent_path);

  MetadataSchema metadata_;
  std::size_t embedding_dims_;
  std::vector<Column> columns_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

// build_row_schema merges the system fields with the caller's metadata schema.
[[nodiscard]] RowSchema build_row_schema(const MetadataSchema& metadata,
                                         std::size_t embedding_dims);

// Inverse of RowSchema::to_json. Throws std::invalid_argument on malformed input.
[[nodiscard]] RowSchema row_schema_from_json(const nlohmann::json& j);

}  // namespace docvec::schema
