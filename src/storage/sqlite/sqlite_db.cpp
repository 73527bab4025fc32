#include "docvec/storage/sqlite/sqlite_db.h"

#include "docvec/core/errors.h"
#include "docvec/observability/logging.h"

#include <filesystem>
#include <sqlite3.h>
#include <system_error>

namespace docvec::storage::sqlite {

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded catalog schema v1 SQL.
// _docvec_tables records the row schema every document table was created with;
// _docvec_fts_indexes records which fields carry a full-text index.
constexpr const char* kSchemaV1 = R"(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS _docvec_schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS _docvec_tables (
  table_name TEXT PRIMARY KEY,
  row_schema_json TEXT NOT NULL,
  embedding_dims INTEGER NOT NULL CHECK(embedding_dims > 0),
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS _docvec_fts_indexes (
  table_name TEXT NOT NULL,
  field TEXT NOT NULL,
  fts_table TEXT NOT NULL UNIQUE,
  created_at TEXT NOT NULL,
  PRIMARY KEY(table_name, field),
  FOREIGN KEY(table_name) REFERENCES _docvec_tables(table_name)
    ON DELETE CASCADE
);

INSERT OR IGNORE INTO _docvec_schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

SqliteResult<std::shared_ptr<SqliteDb>> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return SqliteResult<std::shared_ptr<SqliteDb>>::err(
        SqliteError{"Failed to open database '" + path + "': " + error, rc});
  }

  // Enable foreign keys
  char* err_msg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return SqliteResult<std::shared_ptr<SqliteDb>>::err(
        SqliteError{"Failed to enable foreign keys: " + error, rc});
  }

  return SqliteResult<std::shared_ptr<SqliteDb>>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db, path)));
}

SqliteResult<std::shared_ptr<SqliteDb>> SqliteDb::open_directory(const std::string& dir) {
  if (dir == kInMemoryPath) {
    return open(dir);
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return SqliteResult<std::shared_ptr<SqliteDb>>::err(
        SqliteError{"Failed to create database directory '" + dir + "': " + ec.message(), -1});
  }
  return open((std::filesystem::path(dir) / kDatabaseFileName).string());
}

int SqliteDb::get_schema_version() const {
  // Check if _docvec_schema_version table exists
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM _docvec_schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt.get(), 0);
  }
  return version;
}

SqliteResult<bool> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return SqliteResult<bool>::ok(true);
  }

  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return SqliteResult<bool>::err(SqliteError{"Failed to apply catalog schema v1: " + error, rc});
  }

  return SqliteResult<bool>::ok(true);
}

SqliteResult<bool> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return SqliteResult<bool>::err(SqliteError{"SQL execution failed: " + error, rc});
  }

  return SqliteResult<bool>::ok(true);
}

SqliteError SqliteDb::last_error() const {
  return SqliteError{sqlite3_errmsg(db_.get()), sqlite3_errcode(db_.get()) & 0xff};
}

int SqliteDb::changes() const {
  return sqlite3_changes(db_.get());
}

long long SqliteDb::last_insert_rowid() const {
  return sqlite3_last_insert_rowid(db_.get());
}

// ─────────────────────────────────────────────────────────────────────────────
// PreparedStatement
// ─────────────────────────────────────────────────────────────────────────────

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    error_code_ = rc;
    stmt_ = nullptr;
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transaction
// ─────────────────────────────────────────────────────────────────────────────

Transaction::Transaction(SqliteDb& db) : db_(db) {
  auto begun = db_.exec("BEGIN IMMEDIATE");
  if (!begun.has_value()) {
    throw core::StorageError(begun.error().message, begun.error().code);
  }
}

Transaction::~Transaction() {
  if (!active_) {
    return;
  }
  auto rolled_back = db_.exec("ROLLBACK");
  if (!rolled_back.has_value()) {
    DOCVEC_LOG_ERROR("rollback failed", {{"error", rolled_back.error().message}});
  }
}

void Transaction::commit() {
  auto committed = db_.exec("COMMIT");
  if (!committed.has_value()) {
    throw core::StorageError(committed.error().message, committed.error().code);
  }
  active_ = false;
}

}  // namespace docvec::storage::sqlite
