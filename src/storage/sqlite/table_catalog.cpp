#include "docvec/storage/sqlite/table_catalog.h"

#include <sqlite3.h>

namespace docvec::storage::sqlite {

namespace {

template <typename T>
SqliteResult<T> prepare_failed(const PreparedStatement& stmt) {
  return SqliteResult<T>::err(SqliteError{stmt.error(), stmt.error_code()});
}

template <typename T>
SqliteResult<T> step_failed(const SqliteDb& db) {
  return SqliteResult<T>::err(db.last_error());
}

std::string column_string(sqlite3_stmt* stmt, int col) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return text != nullptr ? std::string(text) : std::string{};
}

}  // namespace

TableCatalog::TableCatalog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

SqliteResult<bool> TableCatalog::table_exists(const std::string& table_name) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT 1 FROM sqlite_master WHERE type IN ('table', 'view') AND name = ?");
  if (!stmt.is_valid()) {
    return prepare_failed<bool>(stmt);
  }
  sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return SqliteResult<bool>::ok(true);
  }
  if (rc == SQLITE_DONE) {
    return SqliteResult<bool>::ok(false);
  }
  return step_failed<bool>(*db_);
}

SqliteResult<std::optional<nlohmann::json>> TableCatalog::find_table(
    const std::string& table_name) const {
  using R = SqliteResult<std::optional<nlohmann::json>>;

  PreparedStatement stmt(db_->connection(),
                         "SELECT row_schema_json FROM _docvec_tables WHERE table_name = ?");
  if (!stmt.is_valid()) {
    return prepare_failed<std::optional<nlohmann::json>>(stmt);
  }
  sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return R::ok(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return step_failed<std::optional<nlohmann::json>>(*db_);
  }

  auto parsed = nlohmann::json::parse(column_string(stmt.get(), 0), nullptr, false);
  if (parsed.is_discarded()) {
    return R::err(SqliteError{"catalog entry for '" + table_name + "' is not valid JSON", -1});
  }
  return R::ok(std::move(parsed));
}

SqliteResult<bool> TableCatalog::register_table(const std::string& table_name,
                                                const nlohmann::json& row_schema,
                                                std::size_t embedding_dims) {
  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO _docvec_tables (table_name, row_schema_json, embedding_dims, created_at)
    VALUES (?, ?, ?, datetime('now'))
  )");
  if (!stmt.is_valid()) {
    return prepare_failed<bool>(stmt);
  }

  const std::string schema_text = row_schema.dump();
  sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, schema_text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(embedding_dims));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return step_failed<bool>(*db_);
  }
  return SqliteResult<bool>::ok(true);
}

SqliteResult<bool> TableCatalog::unregister_table(const std::string& table_name) {
  // Index entries are removed explicitly as well; the cascade only fires when the
  // connection has foreign keys enabled.
  for (const char* sql : {"DELETE FROM _docvec_fts_indexes WHERE table_name = ?",
                          "DELETE FROM _docvec_tables WHERE table_name = ?"}) {
    PreparedStatement stmt(db_->connection(), sql);
    if (!stmt.is_valid()) {
      return prepare_failed<bool>(stmt);
    }
    sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return step_failed<bool>(*db_);
    }
  }
  return SqliteResult<bool>::ok(true);
}

SqliteResult<std::vector<FtsIndexRecord>> TableCatalog::list_fts_indexes(
    const std::string& table_name) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT field, fts_table FROM _docvec_fts_indexes WHERE table_name = ? "
                         "ORDER BY field");
  if (!stmt.is_valid()) {
    return prepare_failed<std::vector<FtsIndexRecord>>(stmt);
  }
  sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<FtsIndexRecord> indexes;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    indexes.push_back(FtsIndexRecord{
        .field = column_string(stmt.get(), 0),
        .fts_table = column_string(stmt.get(), 1),
    });
  }
  if (rc != SQLITE_DONE) {
    return step_failed<std::vector<FtsIndexRecord>>(*db_);
  }
  return SqliteResult<std::vector<FtsIndexRecord>>::ok(std::move(indexes));
}

SqliteResult<bool> TableCatalog::register_fts_index(const std::string& table_name,
                                                    const FtsIndexRecord& index) {
  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO _docvec_fts_indexes (table_name, field, fts_table, created_at)
    VALUES (?, ?, ?, datetime('now'))
  )");
  if (!stmt.is_valid()) {
    return prepare_failed<bool>(stmt);
  }
  sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, index.field.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, index.fts_table.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return step_failed<bool>(*db_);
  }
  return SqliteResult<bool>::ok(true);
}

SqliteResult<bool> TableCatalog::unregister_fts_index(const std::string& table_name,
                                                      const std::string& field) {
  PreparedStatement stmt(db_->connection(),
                         "DELETE FROM _docvec_fts_indexes WHERE table_name = ? AND field = ?");
  if (!stmt.is_valid()) {
    return prepare_failed<bool>(stmt);
  }
  sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, field.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return step_failed<bool>(*db_);
  }
  return SqliteResult<bool>::ok(true);
}

}  // namespace docvec::storage::sqlite
