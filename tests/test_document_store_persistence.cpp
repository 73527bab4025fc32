#include "docvec/core/errors.h"
#include "docvec/storage/sqlite/sqlite_db.h"
#include "docvec/store/document_store.h"

#include "store_fixtures.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <system_error>

using namespace docvec;
using namespace docvec::store;
using nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// File-backed stores: each test uses its own directory under the system temp dir.
// ─────────────────────────────────────────────────────────────────────────────

namespace {

class TempDir {
 public:
  explicit TempDir(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] std::string string() const { return path_.string(); }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

StoreConfig file_config(const TempDir& dir, std::size_t dims = 2) {
  auto config = testing::article_config(dims);
  config.database_path = dir.string();
  return config;
}

}  // namespace

TEST_CASE("DocumentStore: documents and text indexes survive reopening",
          "[store][persistence]") {
  TempDir dir("docvec_test_persistence_reopen");

  {
    auto store = DocumentStore::create(file_config(dir));
    store.write_documents({
        testing::article("d1", "Castles of Wales", {{"page_number", 3}}, domain::Embedding{1.0f, 0.0f}),
        testing::article("d2", "Vain hopes", {{"page_number", 9}}),
    });
    store.create_fts_index("title");
  }

  CHECK(std::filesystem::exists(dir.path() / storage::sqlite::kDatabaseFileName));

  auto reopened = DocumentStore::create(file_config(dir));
  CHECK(reopened.count_documents() == 2);
  CHECK(reopened.has_fts_index("content"));
  CHECK(reopened.has_fts_index("meta.title"));

  const auto hits = reopened.text_search("wales", 5);
  REQUIRE(hits.size() == 1);
  CHECK(hits[0].id == "d1");

  const auto nearest = reopened.similarity_search({1.0f, 0.0f}, 1);
  REQUIRE(nearest.size() == 1);
  CHECK(nearest[0].id == "d1");
  CHECK(*nearest[0].embedding == domain::Embedding{1.0f, 0.0f});
}

TEST_CASE("DocumentStore: reopening with another schema is refused", "[store][persistence]") {
  TempDir dir("docvec_test_persistence_schema");
  { auto store = DocumentStore::create(file_config(dir)); }

  CHECK_THROWS_AS(DocumentStore::create(file_config(dir, 3)), core::StoreInitError);

  auto config = file_config(dir, 3);
  config.exists_policy = ExistsPolicy::kOverwrite;
  auto replaced = DocumentStore::create(config);
  CHECK(replaced.row_schema().embedding_dims() == 3);
  CHECK(replaced.count_documents() == 0);
}

TEST_CASE("DocumentStore: create makes missing directories", "[store][persistence]") {
  TempDir dir("docvec_test_persistence_nested");
  auto config = testing::article_config();
  config.database_path = (dir.path() / "a" / "b").string();

  auto store = DocumentStore::create(config);
  store.write_documents({testing::article("d1", "x", json::object())});
  CHECK(std::filesystem::exists(dir.path() / "a" / "b" / storage::sqlite::kDatabaseFileName));
}

TEST_CASE("DocumentStore: an unusable database path is a storage error", "[store][persistence]") {
  TempDir dir("docvec_test_persistence_blocked");
  std::filesystem::create_directories(dir.path());
  {
    std::ofstream blocker(dir.path() / "file");
    blocker << "not a directory";
  }

  auto config = testing::article_config();
  config.database_path = (dir.path() / "file").string();
  CHECK_THROWS_AS(DocumentStore::create(config), core::StorageError);
}
