#pragma once

#include "docvec/domain/document.h"
#include "docvec/schema/schema_mapper.h"

#include <cstdint>
#include <vector>

struct sqlite3_stmt;

namespace docvec::storage::sqlite {

// Embeddings are stored as float32 values in native byte order, dims * 4 bytes.
[[nodiscard]] std::vector<std::uint8_t> embedding_to_blob(const domain::Embedding& embedding);

// Throws core::StorageError when size is not a multiple of sizeof(float).
[[nodiscard]] domain::Embedding embedding_from_blob(const void* data, int size);

// bind_cell binds one cell to the 1-based parameter index. Returns the SQLite result code.
[[nodiscard]] int bind_cell(sqlite3_stmt* stmt, int index, const schema::Cell& cell);

// read_cell reads result column `col` as the storage class `kind` requires.
// NULL always reads as std::monostate.
[[nodiscard]] schema::Cell read_cell(sqlite3_stmt* stmt, int col, schema::ColumnKind kind);

}  // namespace docvec::storage::sqlite
