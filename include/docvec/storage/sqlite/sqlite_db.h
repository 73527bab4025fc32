#pragma once

#include "docvec/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace docvec::storage::sqlite {

// File name of the single database file inside a store directory.
constexpr const char* kDatabaseFileName = "docvec.sqlite3";
constexpr const char* kInMemoryPath = ":memory:";

// SqliteError is the failure side of every low-level helper: the engine's message and
// its primary result code (-1 when the failure did not come from the engine).
struct SqliteError {
  std::string message;
  int code = -1;
};

template <typename T>
using SqliteResult = core::Result<T, SqliteError>;

// SqliteDb manages a SQLite database connection and the catalog schema.
// Responsibilities:
// - Open/close database connection
// - Initialize catalog schema (migrations)
// - Provide prepared statement helpers
// - Enable foreign keys
//
// Design principles:
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T,E>
// - One connection per instance; stores opened on the same handle share it
class SqliteDb {
 public:
  // Open or create database at path.
  // If path is ":memory:", creates in-memory database.
  [[nodiscard]] static SqliteResult<std::shared_ptr<SqliteDb>> open(const std::string& path);

  // Open or create the store directory `dir` (created if missing) and the database file
  // inside it. ":memory:" is passed through to open().
  [[nodiscard]] static SqliteResult<std::shared_ptr<SqliteDb>> open_directory(
      const std::string& dir);

  ~SqliteDb() = default;

  // Disable copy/move (unique ownership)
  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Get current catalog schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // Apply catalog schema v1 if not already applied
  [[nodiscard]] SqliteResult<bool> ensure_schema_v1();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] SqliteResult<bool> exec(const std::string& sql);

  // Error from the most recent failed engine call on this connection.
  [[nodiscard]] SqliteError last_error() const;

  // Number of rows modified by the most recent INSERT/UPDATE/DELETE.
  [[nodiscard]] int changes() const;

  // Rowid of the most recent successful INSERT.
  [[nodiscard]] long long last_insert_rowid() const;

  [[nodiscard]] const std::string& path() const { return path_; }

  // Get raw connection (for prepared statements)
  // Should be used only by storage implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  SqliteDb(sqlite3* db, std::string path);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  std::string path_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  // Returns true if statement was prepared successfully
  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Get error message if preparation failed
  [[nodiscard]] std::string error() const { return error_; }

  // Result code of the failed preparation (SQLITE_OK when valid)
  [[nodiscard]] int error_code() const { return error_code_; }

  // Get raw statement (for binding/stepping)
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
  int error_code_ = 0;
};

// Transaction is an RAII guard around BEGIN IMMEDIATE / COMMIT.
// A transaction that is not committed is rolled back when the guard is destroyed,
// which covers every exception path of the code holding it.
class Transaction {
 public:
  // Throws core::StorageError when BEGIN fails (e.g. the database is locked).
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  // Throws core::StorageError when COMMIT fails; the guard then rolls back.
  void commit();

 private:
  SqliteDb& db_;
  bool active_ = true;
};

}  // namespace docvec::storage::sqlite
