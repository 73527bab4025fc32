#pragma once

#include "docvec/schema/row_schema.h"
#include "docvec/search/distance.h"
#include "docvec/storage/sqlite/sqlite_db.h"
#include "docvec/storage/sqlite/table_catalog.h"
#include "docvec/store/document_store_interface.h"
#include "docvec/store/store_config.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::store {

// DocumentStore keeps documents in one SQLite table whose columns follow the row
// schema derived from StoreConfig (see schema::RowSchema). Filters are compiled to SQL
// by filter::FilterTranslator; full-text search uses FTS5 tables kept in sync with the
// document table inside every write transaction.
//
// Not thread-safe: one call at a time per instance. Several stores may share one
// SqliteDb handle (one table each).
class DocumentStore final : public IDocumentStore {
 public:
  // Opens (creating if needed) the database directory named by config.database_path,
  // then the table. Throws as the constructor does.
  [[nodiscard]] static DocumentStore create(StoreConfig config);

  // Opens or creates config.table_name in db according to config.exists_policy.
  // Throws std::invalid_argument for an invalid config, core::StoreInitError when the
  // exists policy refuses the table, core::SchemaMismatch for an fts_fields entry that
  // is not a text field, and core::StorageError for engine failures.
  DocumentStore(std::shared_ptr<storage::sqlite::SqliteDb> db, StoreConfig config);

  [[nodiscard]] std::size_t count_documents(
      const std::optional<filter::FilterExpr>& filters = std::nullopt) const override;

  // Matching documents in insertion order.
  [[nodiscard]] std::vector<domain::Document> filter_documents(
      const std::optional<filter::FilterExpr>& filters = std::nullopt) const override;

  // All documents are mapped to rows before the table is touched, then written in one
  // transaction; on any error nothing is committed.
  // Throws core::DuplicateDocumentError under kFail, core::SchemaMismatch for
  // documents that do not fit the row schema.
  std::size_t write_documents(const std::vector<domain::Document>& documents,
                              DuplicatePolicy policy = DuplicatePolicy::kFail) override;

  std::size_t delete_documents(const std::vector<std::string>& document_ids) override;

  // The top_k documents closest to query among those with an embedding that match
  // filters. score is the distance; results are ordered by ascending distance, ties
  // in insertion order.
  // Throws core::SchemaMismatch when query has the wrong length and
  // std::invalid_argument when top_k is zero.
  [[nodiscard]] std::vector<domain::Document> similarity_search(
      const domain::Embedding& query, std::size_t top_k,
      const std::optional<filter::FilterExpr>& filters = std::nullopt,
      search::DistanceMetric metric = search::DistanceMetric::kL2) const;

  // BM25 search over the full-text index of text_field. The query is split into
  // words on ASCII punctuation and whitespace (UTF-8 letters stay inside words), any
  // of which may match; the index tokenizer then folds each word the way it folded
  // the indexed text. A query without words matches nothing. score is the BM25
  // relevance (higher is better).
  // Throws core::IndexNotReadyError when text_field has no index and
  // std::invalid_argument when top_k is zero.
  [[nodiscard]] std::vector<domain::Document> text_search(
      std::string_view query, std::size_t top_k,
      const std::optional<filter::FilterExpr>& filters = std::nullopt,
      std::string_view text_field = schema::kContentColumn) const;

  // Builds a full-text index on "content" or a string metadata leaf ("meta.title" or
  // "title"). No-op when the index exists, unless replace is set.
  // Throws core::SchemaMismatch for any other field.
  void create_fts_index(std::string_view field, bool replace = false);

  [[nodiscard]] bool has_fts_index(std::string_view field) const;

  // Column names of the indexed fields, sorted.
  [[nodiscard]] std::vector<std::string> fts_fields() const;

  [[nodiscard]] const schema::RowSchema& row_schema() const { return row_schema_; }
  [[nodiscard]] const StoreConfig& config() const { return config_; }
  [[nodiscard]] const std::shared_ptr<storage::sqlite::SqliteDb>& database() const { return db_; }

  // {"type": "docvec.store.DocumentStore", "init_parameters": <store config json>}
  [[nodiscard]] nlohmann::json to_json() const;

 private:
  void open_table();
  void drop_table();
  void create_table();
  void create_fts_table(const std::string& column, const std::string& fts_table);

  [[nodiscard]] const schema::Column& resolve_text_field(std::string_view field) const;
  [[nodiscard]] std::string where_clause(const std::optional<filter::FilterExpr>& filters,
                                         std::string_view leading) const;
  [[nodiscard]] std::string select_columns(std::string_view qualifier) const;

  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  StoreConfig config_;
  schema::RowSchema row_schema_;
  storage::sqlite::TableCatalog catalog_;
  std::map<std::string, std::string, std::less<>> fts_tables_;  // column -> FTS5 table
};

}  // namespace docvec::store
