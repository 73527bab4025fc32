#include "docvec/schema/schema_mapper.h"

#include "docvec/core/errors.h"
#include "docvec/schema/timestamp.h"

#include <cmath>
#include <limits>

namespace docvec::schema {

using core::SchemaMismatch;
using nlohmann::json;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Value validation
// ─────────────────────────────────────────────────────────────────────────────

std::string join_path(const std::vector<std::string>& path) {
  std::string out;
  for (const auto& segment : path) {
    if (!out.empty()) {
      out += '.';
    }
    out += segment;
  }
  return out;
}

[[noreturn]] void mismatch(const std::string& path, const FieldType& type, const json& value) {
  throw SchemaMismatch("metadata field '" + path + "' expects " + type.describe() + ", got " +
                       value.dump());
}

bool fits_integer(const json& value, FieldKind kind) {
  if (!value.is_number_integer()) {
    return false;
  }
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    const auto max = kind == FieldKind::kInt32
                         ? static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())
                         : static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    return v <= max;
  }
  if (kind == FieldKind::kInt32) {
    const auto v = value.get<std::int64_t>();
    return v >= std::numeric_limits<std::int32_t>::min() &&
           v <= std::numeric_limits<std::int32_t>::max();
  }
  return true;
}

json normalize_value(const json& value, const FieldType& type, const std::string& path,
                     UnknownFieldPolicy unknown_fields);

json normalize_struct(const json& value, const FieldType& type, const std::string& path,
                      UnknownFieldPolicy unknown_fields) {
  if (!value.is_object()) {
    mismatch(path, type, value);
  }
  json out = json::object();
  for (const auto& item : value.items()) {
    const std::string& key = item.key();
    const json& child = item.value();
    const std::string child_path = path + "." + key;
    const MetadataField* field = type.find_field(key);
    if (field == nullptr) {
      if (unknown_fields == UnknownFieldPolicy::kReject) {
        throw SchemaMismatch("unknown metadata field '" + child_path + "'");
      }
      continue;
    }
    if (child.is_null()) {
      continue;
    }
    out[key] = normalize_value(child, field->type, child_path, unknown_fields);
  }
  return out;
}

// normalize_value checks value against type and returns the form that is stored.
// Only structs are rewritten (nulls and dropped keys removed); everything else is
// returned as given.
json normalize_value(const json& value, const FieldType& type, const std::string& path,
                     UnknownFieldPolicy unknown_fields) {
  switch (type.kind()) {
    case FieldKind::kBool:
      if (!value.is_boolean()) {
        mismatch(path, type, value);
      }
      return value;
    case FieldKind::kInt32:
    case FieldKind::kInt64:
      if (!fits_integer(value, type.kind())) {
        mismatch(path, type, value);
      }
      return value;
    case FieldKind::kFloat:
    case FieldKind::kDouble:
      if (!value.is_number() || !std::isfinite(value.get<double>())) {
        mismatch(path, type, value);
      }
      return value;
    case FieldKind::kString:
      if (!value.is_string()) {
        mismatch(path, type, value);
      }
      return value;
    case FieldKind::kTimestamp:
      if (!value.is_string() || !is_iso8601_timestamp(value.get<std::string>())) {
        mismatch(path, type, value);
      }
      return value;
    case FieldKind::kList: {
      if (!value.is_array()) {
        mismatch(path, type, value);
      }
      json out = json::array();
      for (std::size_t i = 0; i < value.size(); ++i) {
        const std::string item_path = path + "[" + std::to_string(i) + "]";
        if (value[i].is_null()) {
          mismatch(item_path, type.element(), value[i]);
        }
        out.push_back(normalize_value(value[i], type.element(), item_path, unknown_fields));
      }
      return out;
    }
    case FieldKind::kStruct:
      return normalize_struct(value, type, path, unknown_fields);
  }
  mismatch(path, type, value);
}

Cell to_cell(const json& value, const Column& column) {
  switch (column.kind) {
    case ColumnKind::kBoolean:
      return static_cast<std::int64_t>(value.get<bool>() ? 1 : 0);
    case ColumnKind::kInteger:
      return value.get<std::int64_t>();
    case ColumnKind::kReal:
      return value.get<double>();
    case ColumnKind::kText:
    case ColumnKind::kTimestamp:
      return value.get<std::string>();
    case ColumnKind::kJson:
      return value.dump();
    case ColumnKind::kStructMarker:
      return static_cast<std::int64_t>(1);
    case ColumnKind::kEmbedding:
      break;
  }
  throw SchemaMismatch("column '" + column.name + "' cannot hold metadata");
}

// ─────────────────────────────────────────────────────────────────────────────
// Flattening
// ─────────────────────────────────────────────────────────────────────────────

void flatten_struct(const json& object, const std::vector<MetadataField>& fields,
                    const std::vector<std::string>& parent_path, const RowSchema& schema,
                    Row& row) {
  for (const auto& field : fields) {
    auto it = object.find(field.name);
    if (it == object.end()) {
      continue;  // absent: cells stay NULL
    }

    std::vector<std::string> path = parent_path;
    path.push_back(field.name);
    const auto index = schema.column_index(std::string(kMetaPrefix) + join_path(path));
    if (!index) {
      throw SchemaMismatch("no column for metadata field '" + join_path(path) + "'");
    }
    const Column& column = schema.columns()[*index];
    row.cells[*index] = to_cell(*it, column);

    if (field.type.kind() == FieldKind::kStruct) {
      flatten_struct(*it, field.type.fields(), path, schema, row);
    }
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Rebuilding
// ─────────────────────────────────────────────────────────────────────────────

[[noreturn]] void bad_cell(const Column& column) {
  throw core::StorageError("column '" + column.name + "' holds a value of the wrong storage class");
}

json from_cell(const Cell& cell, const Column& column) {
  switch (column.kind) {
    case ColumnKind::kBoolean:
      if (const auto* v = std::get_if<std::int64_t>(&cell)) {
        return *v != 0;
      }
      break;
    case ColumnKind::kInteger:
      if (const auto* v = std::get_if<std::int64_t>(&cell)) {
        return *v;
      }
      break;
    case ColumnKind::kReal:
      if (const auto* v = std::get_if<double>(&cell)) {
        return *v;
      }
      if (const auto* v = std::get_if<std::int64_t>(&cell)) {
        return static_cast<double>(*v);
      }
      break;
    case ColumnKind::kText:
    case ColumnKind::kTimestamp:
      if (const auto* v = std::get_if<std::string>(&cell)) {
        return *v;
      }
      break;
    case ColumnKind::kJson:
      if (const auto* v = std::get_if<std::string>(&cell)) {
        json parsed = json::parse(*v, nullptr, false);
        if (parsed.is_discarded()) {
          bad_cell(column);
        }
        return parsed;
      }
      break;
    case ColumnKind::kStructMarker:
    case ColumnKind::kEmbedding:
      break;
  }
  bad_cell(column);
}

json rebuild_struct(const std::vector<MetadataField>& fields,
                    const std::vector<std::string>& parent_path, const RowSchema& schema,
                    const Row& row) {
  json out = json::object();
  for (const auto& field : fields) {
    std::vector<std::string> path = parent_path;
    path.push_back(field.name);
    const auto index = schema.column_index(std::string(kMetaPrefix) + join_path(path));
    if (!index || *index >= row.cells.size()) {
      throw core::StorageError("row is missing column for metadata field '" + join_path(path) +
                               "'");
    }
    const Cell& cell = row.cells[*index];
    if (std::holds_alternative<std::monostate>(cell)) {
      continue;
    }

    const Column& column = schema.columns()[*index];
    if (column.kind == ColumnKind::kStructMarker) {
      out[field.name] = rebuild_struct(field.type.fields(), path, schema, row);
    } else {
      out[field.name] = from_cell(cell, column);
    }
  }
  return out;
}

}  // namespace

std::optional<UnknownFieldPolicy> parse_unknown_field_policy(std::string_view name) {
  if (name == "reject") {
    return UnknownFieldPolicy::kReject;
  }
  if (name == "drop") {
    return UnknownFieldPolicy::kDrop;
  }
  return std::nullopt;
}

std::string_view to_string(UnknownFieldPolicy policy) {
  switch (policy) {
    case UnknownFieldPolicy::kReject:
      return "reject";
    case UnknownFieldPolicy::kDrop:
      return "drop";
  }
  return "reject";  // unreachable
}

Row to_row(const domain::Document& doc, const RowSchema& schema,
           UnknownFieldPolicy unknown_fields) {
  if (doc.id.empty()) {
    throw SchemaMismatch("document id must not be empty");
  }
  if (!doc.meta.is_object()) {
    throw SchemaMismatch("document '" + doc.id + "': meta must be a JSON object");
  }
  if (doc.embedding && doc.embedding->size() != schema.embedding_dims()) {
    throw SchemaMismatch("document '" + doc.id + "': embedding has " +
                         std::to_string(doc.embedding->size()) + " dimensions, table expects " +
                         std::to_string(schema.embedding_dims()));
  }

  const json meta = normalize_struct(doc.meta, schema.metadata().as_struct(), "meta",
                                     unknown_fields);

  Row row;
  row.cells.resize(schema.columns().size());
  row.cells[0] = doc.id;
  row.cells[1] = doc.content;
  if (doc.embedding) {
    row.cells[2] = *doc.embedding;
  }
  flatten_struct(meta, schema.metadata().fields(), {}, schema, row);
  return row;
}

domain::Document from_row(const Row& row, const RowSchema& schema) {
  if (row.cells.size() != schema.columns().size()) {
    throw core::StorageError("row has " + std::to_string(row.cells.size()) +
                             " cells, table has " + std::to_string(schema.columns().size()) +
                             " columns");
  }

  domain::Document doc;
  if (const auto* id = std::get_if<std::string>(&row.cells[0])) {
    doc.id = *id;
  } else {
    bad_cell(schema.columns()[0]);
  }
  if (const auto* content = std::get_if<std::string>(&row.cells[1])) {
    doc.content = *content;
  }
  if (const auto* embedding = std::get_if<domain::Embedding>(&row.cells[2])) {
    doc.embedding = *embedding;
  }
  doc.meta = rebuild_struct(schema.metadata().fields(), {}, schema, row);
  return doc;
}

}  // namespace docvec::schema
