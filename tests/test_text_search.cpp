#include "docvec/core/errors.h"
#include "docvec/filter/filter_expr.h"
#include "docvec/store/document_store.h"

#include "store_fixtures.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <stdexcept>

using namespace docvec;
using docvec::store::DuplicatePolicy;
using nlohmann::json;

namespace {

store::DocumentStore text_store() {
  auto store = testing::open_memory_store();
  store.write_documents({
      testing::article("d1", "Castles of Wales", {{"page_number", 3}, {"title", "Welsh castles"}}),
      testing::article("d2", "Vain hopes and vain promises", {{"page_number", 9}}),
      testing::article("d3", "Mountains and lakes", {{"page_number", 12}, {"title", "Lakes"}}),
      testing::article("d4", "Rivers of the north", {{"page_number", 20}}),
      testing::article("d5", "Cities at night", {{"page_number", 31}}),
  });
  return store;
}

std::vector<std::string> sorted_ids(const std::vector<domain::Document>& docs) {
  auto ids = testing::ids_of(docs);
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace

TEST_CASE("text_search: finds documents containing a query term", "[search][text]") {
  auto store = text_store();

  const auto results = store.text_search("wales", 10);
  REQUIRE(results.size() == 1);
  CHECK(results[0].id == "d1");
  REQUIRE(results[0].score.has_value());
  CHECK(*results[0].score > 0.0);
}

TEST_CASE("text_search: any query term may match", "[search][text]") {
  auto store = text_store();

  const auto results = store.text_search("vain Wales", 10);
  CHECK(sorted_ids(results) == std::vector<std::string>{"d1", "d2"});
  REQUIRE(results.size() == 2);
  CHECK(*results[0].score >= *results[1].score);
}

TEST_CASE("text_search: query text is tokenised, not parsed", "[search][text]") {
  auto store = text_store();

  CHECK(store.text_search("WALES!", 10).size() == 1);
  CHECK(store.text_search("\"wales\" OR NOT", 10).size() == 1);
  CHECK(store.text_search("?!", 10).empty());
  CHECK(store.text_search("dragons", 10).empty());
}

TEST_CASE("text_search: words with non-ASCII letters are searchable", "[search][text]") {
  auto store = text_store();
  store.write_documents({testing::article("d6", "Un caf\xc3\xa9 \xc3\xa0 Paris", json::object())});

  const auto results = store.text_search("caf\xc3\xa9", 10);
  REQUIRE(results.size() == 1);
  CHECK(results[0].id == "d6");

  // Case and diacritics fold the same way for the query as for the indexed text.
  CHECK(testing::ids_of(store.text_search("CAF\xc3\x89", 10)) == std::vector<std::string>{"d6"});
  CHECK(testing::ids_of(store.text_search("cafe", 10)) == std::vector<std::string>{"d6"});
  CHECK(store.text_search("caf", 10).empty());
}

TEST_CASE("text_search: top_k and filters", "[search][text]") {
  auto store = text_store();

  CHECK(store.text_search("vain wales lakes", 2).size() == 2);
  CHECK(sorted_ids(store.text_search("vain wales lakes", 10, filter::gt("page_number", 5))) ==
        std::vector<std::string>{"d2", "d3"});
  CHECK_THROWS_AS(store.text_search("wales", 0), std::invalid_argument);
}

TEST_CASE("text_search: index follows overwrites and deletes", "[search][text]") {
  auto store = text_store();

  auto changed = testing::article("d1", "Castles of England", {{"page_number", 3}});
  store.write_documents({changed}, DuplicatePolicy::kOverwrite);
  CHECK(store.text_search("wales", 10).empty());
  CHECK(testing::ids_of(store.text_search("england", 10)) == std::vector<std::string>{"d1"});

  CHECK(store.delete_documents({"d1"}) == 1);
  CHECK(store.text_search("england", 10).empty());

  store.write_documents({testing::article("d6", "More castles in Wales", json::object())});
  CHECK(testing::ids_of(store.text_search("wales", 10)) == std::vector<std::string>{"d6"});
}

TEST_CASE("text_search: a field without an index is not ready", "[search][text]") {
  auto store = text_store();
  CHECK_FALSE(store.has_fts_index("title"));
  CHECK_THROWS_AS(store.text_search("lakes", 10, std::nullopt, "title"), core::IndexNotReadyError);

  auto config = testing::article_config();
  config.table_name = "bare";
  config.fts_fields = {};
  auto bare = testing::open_memory_store(config);
  CHECK_THROWS_AS(bare.text_search("anything", 10), core::IndexNotReadyError);
}

TEST_CASE("create_fts_index: indexes existing and later documents", "[search][text]") {
  auto store = text_store();

  store.create_fts_index("title");
  CHECK(store.has_fts_index("meta.title"));
  CHECK(store.fts_fields() == std::vector<std::string>{"content", "meta.title"});

  CHECK(testing::ids_of(store.text_search("lakes", 10, std::nullopt, "title")) ==
        std::vector<std::string>{"d3"});

  store.write_documents({testing::article("d7", "", {{"title", "Lakes of Cumbria"}})});
  CHECK(sorted_ids(store.text_search("lakes", 10, std::nullopt, "meta.title")) ==
        std::vector<std::string>{"d3", "d7"});
}

TEST_CASE("create_fts_index: repeat is a no-op, replace rebuilds", "[search][text]") {
  auto store = text_store();
  store.create_fts_index("content");
  CHECK(store.text_search("wales", 10).size() == 1);

  store.create_fts_index("content", true);
  CHECK(store.fts_fields() == std::vector<std::string>{"content"});
  CHECK(store.text_search("wales", 10).size() == 1);
}

TEST_CASE("create_fts_index: only text fields can be indexed", "[search][text]") {
  auto store = text_store();
  CHECK_THROWS_AS(store.create_fts_index("page_number"), core::SchemaMismatch);
  CHECK_THROWS_AS(store.create_fts_index("topics"), core::SchemaMismatch);
  CHECK_THROWS_AS(store.create_fts_index("id"), core::SchemaMismatch);
  CHECK_THROWS_AS(store.create_fts_index("embedding"), core::SchemaMismatch);
  CHECK_THROWS_AS(store.create_fts_index("missing"), core::SchemaMismatch);
}

TEST_CASE("text indexes can be configured at creation", "[search][text]") {
  auto config = testing::article_config();
  config.fts_fields = {"content", "meta.title", "title"};
  auto store = testing::open_memory_store(config);

  CHECK(store.fts_fields() == std::vector<std::string>{"content", "meta.title"});
}
