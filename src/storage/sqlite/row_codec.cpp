#include "docvec/storage/sqlite/row_codec.h"

#include "docvec/core/errors.h"

#include <cstring>
#include <sqlite3.h>
#include <string>

namespace docvec::storage::sqlite {

std::vector<std::uint8_t> embedding_to_blob(const domain::Embedding& embedding) {
  std::vector<std::uint8_t> blob(embedding.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), embedding.data(), blob.size());
  }
  return blob;
}

domain::Embedding embedding_from_blob(const void* data, int size) {
  if (size < 0 || static_cast<std::size_t>(size) % sizeof(float) != 0) {
    throw core::StorageError("embedding blob of " + std::to_string(size) +
                             " bytes is not a float32 array");
  }
  domain::Embedding embedding(static_cast<std::size_t>(size) / sizeof(float));
  if (size > 0) {
    std::memcpy(embedding.data(), data, static_cast<std::size_t>(size));
  }
  return embedding;
}

int bind_cell(sqlite3_stmt* stmt, int index, const schema::Cell& cell) {
  if (const auto* v = std::get_if<std::int64_t>(&cell)) {
    return sqlite3_bind_int64(stmt, index, *v);
  }
  if (const auto* v = std::get_if<double>(&cell)) {
    return sqlite3_bind_double(stmt, index, *v);
  }
  if (const auto* v = std::get_if<std::string>(&cell)) {
    return sqlite3_bind_text(stmt, index, v->data(), static_cast<int>(v->size()),
                             SQLITE_TRANSIENT);
  }
  if (const auto* v = std::get_if<domain::Embedding>(&cell)) {
    auto blob = embedding_to_blob(*v);
    return sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()),
                             SQLITE_TRANSIENT);
  }
  return sqlite3_bind_null(stmt, index);
}

schema::Cell read_cell(sqlite3_stmt* stmt, int col, schema::ColumnKind kind) {
  const int type = sqlite3_column_type(stmt, col);
  if (type == SQLITE_NULL) {
    return std::monostate{};
  }

  switch (kind) {
    case schema::ColumnKind::kInteger:
    case schema::ColumnKind::kBoolean:
    case schema::ColumnKind::kStructMarker:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
    case schema::ColumnKind::kReal:
      return sqlite3_column_double(stmt, col);
    case schema::ColumnKind::kText:
    case schema::ColumnKind::kTimestamp:
    case schema::ColumnKind::kJson: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
      const int bytes = sqlite3_column_bytes(stmt, col);
      return std::string(text != nullptr ? text : "", static_cast<std::size_t>(bytes));
    }
    case schema::ColumnKind::kEmbedding:
      return embedding_from_blob(sqlite3_column_blob(stmt, col), sqlite3_column_bytes(stmt, col));
  }
  return std::monostate{};  // unreachable
}

}  // namespace docvec::storage::sqlite
