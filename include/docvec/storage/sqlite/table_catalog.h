#pragma once

#include "docvec/storage/sqlite/sqlite_db.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docvec::storage::sqlite {

// FtsIndexRecord is one full-text index registered for a document table.
struct FtsIndexRecord {
  std::string field;      // "content" or "meta.<path>"
  std::string fts_table;  // name of the FTS5 virtual table
};

// TableCatalog reads and writes the catalog tables created by SqliteDb::ensure_schema_v1:
// the row schema each document table was created with and its full-text indexes.
// It never touches the document tables themselves.
class TableCatalog {
 public:
  explicit TableCatalog(std::shared_ptr<SqliteDb> db);

  // Whether a table (or view) with this name exists in the database file, catalogued or not.
  [[nodiscard]] SqliteResult<bool> table_exists(const std::string& table_name) const;

  // Stored row schema JSON, or nullopt when the table is not catalogued.
  [[nodiscard]] SqliteResult<std::optional<nlohmann::json>> find_table(
      const std::string& table_name) const;

  [[nodiscard]] SqliteResult<bool> register_table(const std::string& table_name,
                                                  const nlohmann::json& row_schema,
                                                  std::size_t embedding_dims);

  // Removes the table entry and, through the foreign key, its index entries.
  [[nodiscard]] SqliteResult<bool> unregister_table(const std::string& table_name);

  // Indexes of a table ordered by field name.
  [[nodiscard]] SqliteResult<std::vector<FtsIndexRecord>> list_fts_indexes(
      const std::string& table_name) const;

  [[nodiscard]] SqliteResult<bool> register_fts_index(const std::string& table_name,
                                                      const FtsIndexRecord& index);

  [[nodiscard]] SqliteResult<bool> unregister_fts_index(const std::string& table_name,
                                                        const std::string& field);

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace docvec::storage::sqlite
