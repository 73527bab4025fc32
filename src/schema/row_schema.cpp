#include "docvec/schema/row_schema.h"

#include <stdexcept>

namespace docvec::schema {

namespace {

ColumnKind column_kind_for(FieldKind kind) {
  switch (kind) {
    case FieldKind::kBool:
      return ColumnKind::kBoolean;
    case FieldKind::kInt32:
    case FieldKind::kInt64:
      return ColumnKind::kInteger;
    case FieldKind::kFloat:
    case FieldKind::kDouble:
      return ColumnKind::kReal;
    case FieldKind::kString:
      return ColumnKind::kText;
    case FieldKind::kTimestamp:
      return ColumnKind::kTimestamp;
    case FieldKind::kList:
      return ColumnKind::kJson;
    case FieldKind::kStruct:
      return ColumnKind::kStructMarker;
  }
  return ColumnKind::kText;  // unreachable
}

std::string column_name_for(const std::vector<std::string>& path) {
  std::string name = kMetaPrefix;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i > 0) {
      name += '.';
    }
    name += path[i];
  }
  return name;
}

}  // namespace

std::string_view sql_type(ColumnKind kind) {
  switch (kind) {
    case ColumnKind::kText:
    case ColumnKind::kTimestamp:
    case ColumnKind::kJson:
      return "TEXT";
    case ColumnKind::kInteger:
    case ColumnKind::kBoolean:
    case ColumnKind::kStructMarker:
      return "INTEGER";
    case ColumnKind::kReal:
      return "REAL";
    case ColumnKind::kEmbedding:
      return "BLOB";
  }
  return "BLOB";  // unreachable
}

RowSchema::RowSchema(MetadataSchema metadata, std::size_t embedding_dims)
    : metadata_(std::move(metadata)), embedding_dims_(embedding_dims) {
  if (embedding_dims_ == 0) {
    throw std::invalid_argument("embedding_dims must be a positive integer");
  }

  columns_.push_back(Column{kIdColumn, ColumnKind::kText, {}, std::nullopt});
  columns_.push_back(Column{kContentColumn, ColumnKind::kText, {}, std::nullopt});
  columns_.push_back(Column{kEmbeddingColumn, ColumnKind::kEmbedding, {}, std::nullopt});
  add_metadata_columns(metadata_.fields(), {});

  for (std::size_t i = 0; i < columns_.size(); ++i) {
    index_.emplace(columns_[i].name, i);
  }
}

void RowSchema::add_metadata_columns(const std::vector<MetadataField>& fields,
                                     const std::vector<std::string>& parent_path) {
  for (const auto& field : fields) {
    std::vector<std::string> path = parent_path;
    path.push_back(field.name);

    columns_.push_back(
        Column{column_name_for(path), column_kind_for(field.type.kind()), path, field.type});

    if (field.type.kind() == FieldKind::kStruct) {
      add_metadata_columns(field.type.fields(), path);
    }
  }
}

const Column* RowSchema::find_column(std::string_view name) const {
  auto it = index_.find(name);
  return it != index_.end() ? &columns_[it->second] : nullptr;
}

std::optional<std::size_t> RowSchema::column_index(std::string_view name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

nlohmann::json RowSchema::to_json() const {
  return nlohmann::json{{"embedding_dims", embedding_dims_},
                        {"metadata", schema_to_json(metadata_)}};
}

RowSchema build_row_schema(const MetadataSchema& metadata, std::size_t embedding_dims) {
  return RowSchema(metadata, embedding_dims);
}

RowSchema row_schema_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("embedding_dims") ||
      !j["embedding_dims"].is_number_unsigned() || !j.contains("metadata")) {
    throw std::invalid_argument("row schema: expected {\"embedding_dims\", \"metadata\"}");
  }
  return RowSchema(schema_from_json(j["metadata"]), j["embedding_dims"].get<std::size_t>());
}

}  // namespace docvec::schema
