#include "docvec/store/document_store.h"

#include "docvec/core/errors.h"
#include "docvec/core/normalization.h"
#include "docvec/filter/filter_translator.h"
#include "docvec/observability/logging.h"
#include "docvec/schema/schema_mapper.h"
#include "docvec/storage/sqlite/row_codec.h"
#include "docvec/storage/sqlite/sql_text.h"

#include <algorithm>
#include <set>
#include <sqlite3.h>
#include <stdexcept>

namespace docvec::store {

using storage::sqlite::PreparedStatement;
using storage::sqlite::quote_identifier;
using storage::sqlite::SqliteDb;
using storage::sqlite::SqliteResult;
using storage::sqlite::Transaction;

namespace {

StoreConfig validated(StoreConfig config) {
  validate_store_config(config);
  return config;
}

std::shared_ptr<SqliteDb> require_db(std::shared_ptr<SqliteDb> db) {
  if (!db) {
    throw std::invalid_argument("DocumentStore: database handle must not be null");
  }
  return db;
}

template <typename T>
T unwrap(SqliteResult<T> result, const std::string& context) {
  if (!result.has_value()) {
    DOCVEC_LOG_ERROR("storage failure", {{"context", context}, {"error", result.error().message}});
    throw core::StorageError(context + ": " + result.error().message, result.error().code);
  }
  return result.value();
}

void require_prepared(const PreparedStatement& stmt, const std::string& context) {
  if (!stmt.is_valid()) {
    DOCVEC_LOG_ERROR("storage failure", {{"context", context}, {"error", stmt.error()}});
    throw core::StorageError(context + ": " + stmt.error(), stmt.error_code());
  }
}

[[noreturn]] void step_failed(const SqliteDb& db, const std::string& context) {
  const auto error = db.last_error();
  DOCVEC_LOG_ERROR("storage failure", {{"context", context}, {"error", error.message}});
  throw core::StorageError(context + ": " + error.message, error.code);
}

void step_done(const SqliteDb& db, const PreparedStatement& stmt, const std::string& context) {
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    step_failed(db, context);
  }
}

void bind_or_throw(const SqliteDb& db, const PreparedStatement& stmt, int index,
                   const schema::Cell& cell, const std::string& context) {
  if (storage::sqlite::bind_cell(stmt.get(), index, cell) != SQLITE_OK) {
    step_failed(db, context);
  }
}

std::string fts_table_name(const std::string& table, const std::string& column) {
  return table + "__fts__" + column;
}

schema::Row read_row(sqlite3_stmt* stmt, const schema::RowSchema& row_schema) {
  schema::Row row;
  row.cells.reserve(row_schema.columns().size());
  for (std::size_t i = 0; i < row_schema.columns().size(); ++i) {
    row.cells.push_back(
        storage::sqlite::read_cell(stmt, static_cast<int>(i), row_schema.columns()[i].kind));
  }
  return row;
}

// Builds an FTS5 MATCH expression that ORs the quoted query tokens.
std::string match_expression(const std::vector<std::string>& tokens) {
  std::string expr;
  for (const auto& token : tokens) {
    if (!expr.empty()) {
      expr += " OR ";
    }
    // FTS5 string: the engine's own tokenizer splits and folds the quoted bytes.
    expr += '"';
    for (const char ch : token) {
      if (ch == '"') {
        expr += '"';
      }
      expr += ch;
    }
    expr += '"';
  }
  return expr;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

DocumentStore DocumentStore::create(StoreConfig config) {
  validate_store_config(config);
  auto db = unwrap(SqliteDb::open_directory(config.database_path),
                   "open database '" + config.database_path + "'");
  return DocumentStore(std::move(db), std::move(config));
}

DocumentStore::DocumentStore(std::shared_ptr<SqliteDb> db, StoreConfig config)
    : db_(require_db(std::move(db))),
      config_(validated(std::move(config))),
      row_schema_(schema::build_row_schema(config_.metadata_schema, config_.embedding_dims)),
      catalog_(db_) {
  unwrap(db_->ensure_schema_v1(), "initialise catalog");
  open_table();
}

void DocumentStore::open_table() {
  const std::string& table = config_.table_name;
  const bool physical = unwrap(catalog_.table_exists(table), "look up table '" + table + "'");
  const auto stored = unwrap(catalog_.find_table(table), "read catalog for '" + table + "'");
  const bool exists = physical || stored.has_value();

  if (exists) {
    switch (config_.exists_policy) {
      case ExistsPolicy::kFail:
        throw core::StoreInitError("table '" + table + "' already exists");
      case ExistsPolicy::kOverwrite: {
        Transaction tx(*db_);
        drop_table();
        create_table();
        tx.commit();
        DOCVEC_LOG_INFO("table recreated", {{"table", table}});
        return;
      }
      case ExistsPolicy::kOpen:
        break;
    }

    if (!stored) {
      throw core::StoreInitError("table '" + table + "' exists but is not a docvec table");
    }
    if (!physical) {
      throw core::StoreInitError("table '" + table + "' is catalogued but missing");
    }

    std::optional<schema::RowSchema> existing;
    try {
      existing = schema::row_schema_from_json(*stored);
    } catch (const std::invalid_argument& e) {
      throw core::StoreInitError("table '" + table + "' has an unreadable catalog entry: " +
                                 e.what());
    }
    if (!(*existing == row_schema_)) {
      throw core::StoreInitError("table '" + table +
                                 "' was created with a different schema or embedding size: " +
                                 stored->dump());
    }

    for (auto& index : unwrap(catalog_.list_fts_indexes(table), "list text indexes")) {
      fts_tables_.emplace(std::move(index.field), std::move(index.fts_table));
    }
    DOCVEC_LOG_DEBUG("table opened", {{"table", table},
                                      observability::int_field("indexes", static_cast<std::int64_t>(fts_tables_.size()))});
    return;
  }

  Transaction tx(*db_);
  create_table();
  tx.commit();
  DOCVEC_LOG_INFO("table created",
                  {{"table", table},
                   observability::int_field("dims",
                                            static_cast<std::int64_t>(config_.embedding_dims))});
}

void DocumentStore::drop_table() {
  const std::string& table = config_.table_name;
  for (const auto& index : unwrap(catalog_.list_fts_indexes(table), "list text indexes")) {
    unwrap(db_->exec("DROP TABLE IF EXISTS " + quote_identifier(index.fts_table)),
           "drop text index '" + index.fts_table + "'");
  }
  unwrap(db_->exec("DROP TABLE IF EXISTS " + quote_identifier(table)),
         "drop table '" + table + "'");
  unwrap(catalog_.unregister_table(table), "unregister table '" + table + "'");
  fts_tables_.clear();
}

// Runs inside the caller's transaction. fts_tables_ is only updated once every
// statement has succeeded.
void DocumentStore::create_table() {
  const std::string& table = config_.table_name;

  std::vector<std::pair<std::string, std::string>> indexes;
  for (const auto& field : config_.fts_fields) {
    const std::string& column = resolve_text_field(field).name;
    const bool seen = std::any_of(indexes.begin(), indexes.end(),
                                  [&](const auto& entry) { return entry.first == column; });
    if (!seen) {
      indexes.emplace_back(column, fts_table_name(table, column));
    }
  }

  std::string ddl = "CREATE TABLE " + quote_identifier(table) + " (\n";
  const auto& columns = row_schema_.columns();
  for (std::size_t i = 0; i < columns.size(); ++i) {
    ddl += "  " + quote_identifier(columns[i].name) + " " +
           std::string(schema::sql_type(columns[i].kind));
    if (columns[i].name == schema::kIdColumn) {
      ddl += " NOT NULL UNIQUE";
    }
    ddl += i + 1 < columns.size() ? ",\n" : "\n";
  }
  ddl += ")";

  unwrap(db_->exec(ddl), "create table '" + table + "'");
  unwrap(catalog_.register_table(table, row_schema_.to_json(), config_.embedding_dims),
         "register table '" + table + "'");

  for (const auto& [column, fts_table] : indexes) {
    create_fts_table(column, fts_table);
  }
  for (auto& [column, fts_table] : indexes) {
    fts_tables_.emplace(std::move(column), std::move(fts_table));
  }
}

void DocumentStore::create_fts_table(const std::string& column, const std::string& fts_table) {
  const std::string& table = config_.table_name;
  unwrap(db_->exec("CREATE VIRTUAL TABLE " + quote_identifier(fts_table) + " USING fts5(body)"),
         "create text index on '" + column + "'");
  unwrap(db_->exec("INSERT INTO " + quote_identifier(fts_table) + " (rowid, body) SELECT rowid, " +
                   quote_identifier(column) + " FROM " + quote_identifier(table) + " WHERE " +
                   quote_identifier(column) + " IS NOT NULL"),
         "populate text index on '" + column + "'");
  unwrap(catalog_.register_fts_index(table, {.field = column, .fts_table = fts_table}),
         "register text index on '" + column + "'");
  DOCVEC_LOG_INFO("text index built", {{"table", table}, {"field", column}});
}

// ─────────────────────────────────────────────────────────────────────────────
// SQL helpers
// ─────────────────────────────────────────────────────────────────────────────

const schema::Column& DocumentStore::resolve_text_field(std::string_view field) const {
  std::string name(field);
  if (field != schema::kContentColumn && field != schema::kIdColumn &&
      field.rfind(schema::kMetaPrefix, 0) != 0) {
    name = std::string(schema::kMetaPrefix) + name;
  }

  const schema::Column* column = row_schema_.find_column(name);
  const bool text = column != nullptr && column->kind == schema::ColumnKind::kText &&
                    column->name != schema::kIdColumn;
  if (!text) {
    throw core::SchemaMismatch("full-text index needs 'content' or a string metadata field, got '" +
                               std::string(field) + "'");
  }
  return *column;
}

std::string DocumentStore::where_clause(const std::optional<filter::FilterExpr>& filters,
                                        std::string_view leading) const {
  std::string clause(leading);
  if (filters) {
    const std::string predicate = filter::FilterTranslator(row_schema_).translate(*filters);
    clause += clause.empty() ? " WHERE (" : " AND (";
    clause += predicate + ")";
  }
  return clause;
}

std::string DocumentStore::select_columns(std::string_view qualifier) const {
  std::string out;
  for (const auto& column : row_schema_.columns()) {
    if (!out.empty()) {
      out += ", ";
    }
    if (!qualifier.empty()) {
      out += quote_identifier(qualifier) + ".";
    }
    out += quote_identifier(column.name);
  }
  return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// IDocumentStore
// ─────────────────────────────────────────────────────────────────────────────

std::size_t DocumentStore::count_documents(const std::optional<filter::FilterExpr>& filters) const {
  const std::string sql =
      "SELECT COUNT(*) FROM " + quote_identifier(config_.table_name) + where_clause(filters, "");

  PreparedStatement stmt(db_->connection(), sql);
  require_prepared(stmt, "count documents");
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    step_failed(*db_, "count documents");
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<domain::Document> DocumentStore::filter_documents(
    const std::optional<filter::FilterExpr>& filters) const {
  const std::string sql = "SELECT " + select_columns("") + " FROM " +
                          quote_identifier(config_.table_name) + where_clause(filters, "") +
                          " ORDER BY rowid";

  PreparedStatement stmt(db_->connection(), sql);
  require_prepared(stmt, "filter documents");

  std::vector<domain::Document> documents;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    documents.push_back(schema::from_row(read_row(stmt.get(), row_schema_), row_schema_));
  }
  if (rc != SQLITE_DONE) {
    step_failed(*db_, "filter documents");
  }
  return documents;
}

std::size_t DocumentStore::write_documents(const std::vector<domain::Document>& documents,
                                           DuplicatePolicy policy) {
  if (documents.empty()) {
    return 0;
  }

  std::vector<schema::Row> rows;
  rows.reserve(documents.size());
  for (const auto& doc : documents) {
    rows.push_back(schema::to_row(doc, row_schema_, config_.unknown_field_policy));
  }

  const std::string table = quote_identifier(config_.table_name);
  const auto& columns = row_schema_.columns();
  std::string column_list;
  std::string placeholders;
  std::string assignments;
  for (const auto& column : columns) {
    if (!column_list.empty()) {
      column_list += ", ";
      placeholders += ", ";
      assignments += ", ";
    }
    column_list += quote_identifier(column.name);
    placeholders += "?";
    assignments += quote_identifier(column.name) + " = ?";
  }

  Transaction tx(*db_);

  PreparedStatement find(db_->connection(), "SELECT rowid FROM " + table + " WHERE \"id\" = ?");
  require_prepared(find, "write documents");
  PreparedStatement insert(db_->connection(),
                           "INSERT INTO " + table + " (" + column_list + ") VALUES (" +
                               placeholders + ")");
  require_prepared(insert, "write documents");
  PreparedStatement update(db_->connection(),
                           "UPDATE " + table + " SET " + assignments + " WHERE rowid = ?");
  require_prepared(update, "write documents");

  struct FtsWriter {
    std::size_t column_index;
    std::unique_ptr<PreparedStatement> remove;
    std::unique_ptr<PreparedStatement> add;
  };
  std::vector<FtsWriter> fts_writers;
  for (const auto& [column, fts_table] : fts_tables_) {
    const auto index = row_schema_.column_index(column);
    if (!index) {
      throw core::StorageError("text index on unknown column '" + column + "'");
    }
    FtsWriter writer{
        *index,
        std::make_unique<PreparedStatement>(
            db_->connection(), "DELETE FROM " + quote_identifier(fts_table) + " WHERE rowid = ?"),
        std::make_unique<PreparedStatement>(
            db_->connection(),
            "INSERT INTO " + quote_identifier(fts_table) + " (rowid, body) VALUES (?, ?)"),
    };
    require_prepared(*writer.remove, "write documents");
    require_prepared(*writer.add, "write documents");
    fts_writers.push_back(std::move(writer));
  }

  auto sync_text_indexes = [&](sqlite3_int64 rowid, const schema::Row& row, bool replace) {
    for (auto& writer : fts_writers) {
      if (replace) {
        writer.remove->reset();
        sqlite3_bind_int64(writer.remove->get(), 1, rowid);
        step_done(*db_, *writer.remove, "update text index");
      }
      const schema::Cell& body = row.cells[writer.column_index];
      if (std::holds_alternative<std::monostate>(body)) {
        continue;
      }
      writer.add->reset();
      sqlite3_bind_int64(writer.add->get(), 1, rowid);
      bind_or_throw(*db_, *writer.add, 2, body, "update text index");
      step_done(*db_, *writer.add, "update text index");
    }
  };

  std::set<std::string> seen;
  std::size_t inserted = 0;
  std::size_t replaced = 0;
  for (std::size_t i = 0; i < documents.size(); ++i) {
    const std::string& id = documents[i].id;
    const bool repeated = !seen.insert(id).second;

    find.reset();
    sqlite3_bind_text(find.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<sqlite3_int64> existing;
    const int rc = sqlite3_step(find.get());
    if (rc == SQLITE_ROW) {
      existing = sqlite3_column_int64(find.get(), 0);
    } else if (rc != SQLITE_DONE) {
      step_failed(*db_, "look up document '" + id + "'");
    }

    if (existing) {
      switch (policy) {
        case DuplicatePolicy::kFail:
          throw core::DuplicateDocumentError(
              repeated ? "document '" + id + "' appears more than once in the batch"
                       : "document '" + id + "' already exists");
        case DuplicatePolicy::kSkip:
          continue;
        case DuplicatePolicy::kOverwrite:
          break;
      }

      update.reset();
      for (std::size_t c = 0; c < columns.size(); ++c) {
        bind_or_throw(*db_, update, static_cast<int>(c + 1), rows[i].cells[c], "update document");
      }
      sqlite3_bind_int64(update.get(), static_cast<int>(columns.size() + 1), *existing);
      step_done(*db_, update, "update document '" + id + "'");
      sync_text_indexes(*existing, rows[i], true);
      ++replaced;
      continue;
    }

    insert.reset();
    for (std::size_t c = 0; c < columns.size(); ++c) {
      bind_or_throw(*db_, insert, static_cast<int>(c + 1), rows[i].cells[c], "insert document");
    }
    step_done(*db_, insert, "insert document '" + id + "'");
    sync_text_indexes(db_->last_insert_rowid(), rows[i], false);
    ++inserted;
  }

  tx.commit();

  DOCVEC_LOG_INFO("documents written",
                  {{"table", config_.table_name},
                   {"policy", std::string(to_string(policy))},
                   observability::int_field("batch", static_cast<std::int64_t>(documents.size())),
                   observability::int_field("inserted", static_cast<std::int64_t>(inserted)),
                   observability::int_field("replaced", static_cast<std::int64_t>(replaced))});

  if (policy == DuplicatePolicy::kOverwrite) {
    return seen.size();
  }
  return inserted;
}

std::size_t DocumentStore::delete_documents(const std::vector<std::string>& document_ids) {
  if (document_ids.empty()) {
    return 0;
  }

  const std::string table = quote_identifier(config_.table_name);
  Transaction tx(*db_);

  std::vector<std::unique_ptr<PreparedStatement>> fts_deletes;
  for (const auto& [column, fts_table] : fts_tables_) {
    fts_deletes.push_back(std::make_unique<PreparedStatement>(
        db_->connection(), "DELETE FROM " + quote_identifier(fts_table) +
                               " WHERE rowid IN (SELECT rowid FROM " + table +
                               " WHERE \"id\" = ?)"));
    require_prepared(*fts_deletes.back(), "delete documents");
  }
  PreparedStatement remove(db_->connection(), "DELETE FROM " + table + " WHERE \"id\" = ?");
  require_prepared(remove, "delete documents");

  std::size_t removed = 0;
  for (const auto& id : document_ids) {
    for (auto& fts_delete : fts_deletes) {
      fts_delete->reset();
      sqlite3_bind_text(fts_delete->get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
      step_done(*db_, *fts_delete, "delete text index entries");
    }
    remove.reset();
    sqlite3_bind_text(remove.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
    step_done(*db_, remove, "delete document '" + id + "'");
    removed += static_cast<std::size_t>(db_->changes());
  }

  tx.commit();
  DOCVEC_LOG_INFO("documents deleted",
                  {{"table", config_.table_name},
                   observability::int_field("requested", static_cast<std::int64_t>(document_ids.size())),
                   observability::int_field("removed", static_cast<std::int64_t>(removed))});
  return removed;
}

// ─────────────────────────────────────────────────────────────────────────────
// Search
// ─────────────────────────────────────────────────────────────────────────────

std::vector<domain::Document> DocumentStore::similarity_search(
    const domain::Embedding& query, std::size_t top_k,
    const std::optional<filter::FilterExpr>& filters, search::DistanceMetric metric) const {
  if (top_k == 0) {
    throw std::invalid_argument("top_k must be greater than zero");
  }
  if (query.size() != row_schema_.embedding_dims()) {
    throw core::SchemaMismatch("query embedding has " + std::to_string(query.size()) +
                               " dimensions, table expects " +
                               std::to_string(row_schema_.embedding_dims()));
  }

  const std::string sql = "SELECT " + select_columns("") + " FROM " +
                          quote_identifier(config_.table_name) +
                          where_clause(filters, " WHERE \"embedding\" IS NOT NULL") +
                          " ORDER BY rowid";

  PreparedStatement stmt(db_->connection(), sql);
  require_prepared(stmt, "similarity search");

  std::vector<domain::Document> candidates;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto doc = schema::from_row(read_row(stmt.get(), row_schema_), row_schema_);
    if (!doc.embedding || doc.embedding->size() != query.size()) {
      throw core::StorageError("document '" + doc.id + "' has a malformed embedding");
    }
    doc.score = search::distance(metric, query, *doc.embedding);
    candidates.push_back(std::move(doc));
  }
  if (rc != SQLITE_DONE) {
    step_failed(*db_, "similarity search");
  }

  // Rows arrive in insertion order; a stable sort keeps it for equal distances.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const domain::Document& a, const domain::Document& b) {
                     return *a.score < *b.score;
                   });
  if (candidates.size() > top_k) {
    candidates.resize(top_k);
  }

  DOCVEC_LOG_DEBUG("similarity search",
                   {{"table", config_.table_name},
                    {"metric", std::string(search::to_string(metric))},
                    observability::int_field("results", static_cast<std::int64_t>(candidates.size()))});
  return candidates;
}

std::vector<domain::Document> DocumentStore::text_search(
    std::string_view query, std::size_t top_k, const std::optional<filter::FilterExpr>& filters,
    std::string_view text_field) const {
  if (top_k == 0) {
    throw std::invalid_argument("top_k must be greater than zero");
  }

  std::string column(text_field);
  if (text_field != schema::kContentColumn && text_field.rfind(schema::kMetaPrefix, 0) != 0) {
    column = std::string(schema::kMetaPrefix) + column;
  }
  auto index = fts_tables_.find(column);
  if (index == fts_tables_.end()) {
    throw core::IndexNotReadyError("no full-text index on '" + std::string(text_field) +
                                   "'; create one with create_fts_index");
  }

  const auto tokens = core::tokenize_words(query);
  if (tokens.empty()) {
    return {};
  }

  const std::string fts = quote_identifier(index->second);
  const std::string table = quote_identifier(config_.table_name);
  const std::string sql = "SELECT " + select_columns(config_.table_name) + ", bm25(" + fts +
                          ") AS relevance FROM " + fts + " JOIN " + table + " ON " + table +
                          ".rowid = " + fts + ".rowid" +
                          where_clause(filters, " WHERE " + fts + " MATCH ?") +
                          " ORDER BY relevance, " + table + ".rowid LIMIT ?";

  PreparedStatement stmt(db_->connection(), sql);
  require_prepared(stmt, "text search");

  const std::string match = match_expression(tokens);
  sqlite3_bind_text(stmt.get(), 1, match.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(top_k));

  const int relevance_col = static_cast<int>(row_schema_.columns().size());
  std::vector<domain::Document> results;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto doc = schema::from_row(read_row(stmt.get(), row_schema_), row_schema_);
    // bm25() is negative, more negative meaning more relevant.
    doc.score = -sqlite3_column_double(stmt.get(), relevance_col);
    results.push_back(std::move(doc));
  }
  if (rc != SQLITE_DONE) {
    step_failed(*db_, "text search");
  }

  DOCVEC_LOG_DEBUG("text search", {{"table", config_.table_name},
                                   {"field", column},
                                   observability::int_field("results", static_cast<std::int64_t>(results.size()))});
  return results;
}

// ─────────────────────────────────────────────────────────────────────────────
// Text indexes
// ─────────────────────────────────────────────────────────────────────────────

void DocumentStore::create_fts_index(std::string_view field, bool replace) {
  const std::string column = resolve_text_field(field).name;
  const bool exists = fts_tables_.find(column) != fts_tables_.end();
  if (exists && !replace) {
    return;
  }

  const std::string& table = config_.table_name;
  const std::string fts_table = fts_table_name(table, column);

  Transaction tx(*db_);
  if (exists) {
    unwrap(db_->exec("DROP TABLE IF EXISTS " + quote_identifier(fts_tables_.at(column))),
           "drop text index on '" + column + "'");
    unwrap(catalog_.unregister_fts_index(table, column),
           "unregister text index on '" + column + "'");
  }
  create_fts_table(column, fts_table);
  tx.commit();

  fts_tables_[column] = fts_table;
}

bool DocumentStore::has_fts_index(std::string_view field) const {
  std::string column(field);
  if (field != schema::kContentColumn && field.rfind(schema::kMetaPrefix, 0) != 0) {
    column = std::string(schema::kMetaPrefix) + column;
  }
  return fts_tables_.find(column) != fts_tables_.end();
}

std::vector<std::string> DocumentStore::fts_fields() const {
  std::vector<std::string> fields;
  fields.reserve(fts_tables_.size());
  for (const auto& entry : fts_tables_) {
    fields.push_back(entry.first);
  }
  return fields;
}

nlohmann::json DocumentStore::to_json() const {
  return nlohmann::json{{"type", "docvec.store.DocumentStore"},
                        {"init_parameters", store_config_to_json(config_)}};
}

}  // namespace docvec::store
