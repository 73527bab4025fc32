#include "docvec/core/errors.h"
#include "docvec/filter/filter_json.h"
#include "docvec/retrieval/embedding_retriever.h"
#include "docvec/retrieval/fts_retriever.h"

#include "store_fixtures.h"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace docvec;
using namespace docvec::retrieval;
using docvec::search::DistanceMetric;
using nlohmann::json;

namespace {

store::DocumentStore retrieval_store() {
  auto store = testing::open_memory_store();
  store.write_documents({
      testing::article("e1", "Castles of Wales", {{"page_number", 1}}, domain::Embedding{1.0f, 0.0f}),
      testing::article("e2", "Castles of Spain", {{"page_number", 2}}, domain::Embedding{0.0f, 1.0f}),
      testing::article("e3", "Castle walls", {{"page_number", 3}}, domain::Embedding{0.6f, 0.8f}),
  });
  return store;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// EmbeddingRetriever
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("EmbeddingRetriever: uses its defaults", "[retrieval][embedding]") {
  auto store = retrieval_store();
  const EmbeddingRetriever retriever(store);

  CHECK(retriever.config().top_k == kDefaultTopK);
  CHECK(retriever.config().metric == DistanceMetric::kL2);
  CHECK(testing::ids_of(retriever.retrieve({1.0f, 0.0f})) ==
        std::vector<std::string>{"e1", "e3", "e2"});
}

TEST_CASE("EmbeddingRetriever: call arguments take precedence", "[retrieval][embedding]") {
  auto store = retrieval_store();
  EmbeddingRetrieverConfig config;
  config.top_k = 1;
  config.filters = filter::ge("page_number", 2);
  const EmbeddingRetriever retriever(store, config);

  CHECK(testing::ids_of(retriever.retrieve({1.0f, 0.0f})) == std::vector<std::string>{"e3"});
  CHECK(retriever.retrieve({1.0f, 0.0f}, 5).size() == 2);
  // Call-time filters replace the defaults rather than combining with them.
  CHECK(testing::ids_of(retriever.retrieve({1.0f, 0.0f}, 5, filter::le("page_number", 1))) ==
        std::vector<std::string>{"e1"});
}

TEST_CASE("EmbeddingRetriever: configured metric is used", "[retrieval][embedding]") {
  auto store = retrieval_store();
  EmbeddingRetrieverConfig config;
  config.metric = DistanceMetric::kDot;
  const EmbeddingRetriever retriever(store, config);

  const auto results = retriever.retrieve({0.0f, 1.0f}, 1);
  REQUIRE(results.size() == 1);
  CHECK(results[0].id == "e2");
  CHECK(*results[0].score == 0.0);
}

TEST_CASE("EmbeddingRetriever: argument checks", "[retrieval][embedding]") {
  auto store = retrieval_store();

  EmbeddingRetrieverConfig zero;
  zero.top_k = 0;
  CHECK_THROWS_AS(EmbeddingRetriever(store, zero), std::invalid_argument);

  const EmbeddingRetriever retriever(store);
  CHECK_THROWS_AS(retriever.retrieve({}), std::invalid_argument);
  CHECK_THROWS_AS(retriever.retrieve({1.0f, 0.0f}, 0), std::invalid_argument);
  CHECK_THROWS_AS(retriever.retrieve({1.0f, 0.0f, 0.0f}), core::SchemaMismatch);
}

TEST_CASE("EmbeddingRetriever: JSON form round-trips its configuration", "[retrieval][embedding]") {
  auto store = retrieval_store();
  EmbeddingRetrieverConfig config;
  config.top_k = 4;
  config.metric = DistanceMetric::kCosine;
  config.filters = filter::logical_and({filter::gt("page_number", 1), filter::eq("title", nullptr)});
  const EmbeddingRetriever retriever(store, config);

  const json j = retriever.to_json();
  CHECK(j["type"] == "docvec.retrieval.EmbeddingRetriever");
  CHECK(j["init_parameters"]["top_k"] == 4);
  CHECK(j["init_parameters"]["metric"] == "cosine");
  CHECK(j["init_parameters"]["document_store"]["type"] == "docvec.store.DocumentStore");

  const auto restored = embedding_retriever_config_from_json(j);
  CHECK(restored.top_k == 4);
  CHECK(restored.metric == DistanceMetric::kCosine);
  REQUIRE(restored.filters.has_value());
  CHECK(*restored.filters == *config.filters);
}

TEST_CASE("embedding_retriever_config_from_json: defaults and errors", "[retrieval][embedding]") {
  const json minimal = {{"type", "docvec.retrieval.EmbeddingRetriever"},
                        {"init_parameters", json::object()}};
  const auto config = embedding_retriever_config_from_json(minimal);
  CHECK(config.top_k == kDefaultTopK);
  CHECK_FALSE(config.filters.has_value());

  auto with = [&](const char* key, json value) {
    json j = minimal;
    j["init_parameters"][key] = std::move(value);
    return j;
  };
  CHECK_THROWS_AS(embedding_retriever_config_from_json(with("top_k", 0)), std::invalid_argument);
  CHECK_THROWS_AS(embedding_retriever_config_from_json(with("top_k", "ten")), std::invalid_argument);
  CHECK_THROWS_AS(embedding_retriever_config_from_json(with("metric", "manhattan")),
                  std::invalid_argument);
  CHECK_THROWS_AS(embedding_retriever_config_from_json(with("filters", json{{"operator", "=="}})),
                  core::UnsupportedFilterError);
  CHECK_THROWS_AS(embedding_retriever_config_from_json(
                      json{{"type", "docvec.retrieval.FtsRetriever"}, {"init_parameters", {}}}),
                  std::invalid_argument);
}

// ─────────────────────────────────────────────────────────────────────────────
// FtsRetriever
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("FtsRetriever: keyword retrieval with defaults", "[retrieval][fts]") {
  auto store = retrieval_store();
  const FtsRetriever retriever(store);

  CHECK(retriever.config().text_field == "content");
  const auto results = retriever.retrieve("wales");
  REQUIRE(results.size() == 1);
  CHECK(results[0].id == "e1");
}

TEST_CASE("FtsRetriever: call arguments take precedence", "[retrieval][fts]") {
  auto store = retrieval_store();
  FtsRetrieverConfig config;
  config.top_k = 1;
  config.filters = filter::eq("page_number", 2);
  const FtsRetriever retriever(store, config);

  CHECK(testing::ids_of(retriever.retrieve("castles")) == std::vector<std::string>{"e2"});
  CHECK(retriever.retrieve("castles", 5, filter::ge("page_number", 1)).size() == 2);
}

TEST_CASE("FtsRetriever: errors", "[retrieval][fts]") {
  auto store = retrieval_store();

  FtsRetrieverConfig zero;
  zero.top_k = 0;
  CHECK_THROWS_AS(FtsRetriever(store, zero), std::invalid_argument);

  const FtsRetriever retriever(store);
  CHECK_THROWS_AS(retriever.retrieve(""), std::invalid_argument);
  CHECK_THROWS_AS(retriever.retrieve("wales", 0), std::invalid_argument);

  FtsRetrieverConfig on_title;
  on_title.text_field = "title";
  const FtsRetriever title_retriever(store, on_title);
  CHECK_THROWS_AS(title_retriever.retrieve("castles"), core::IndexNotReadyError);
}

TEST_CASE("FtsRetriever: JSON form round-trips its configuration", "[retrieval][fts]") {
  auto store = retrieval_store();
  FtsRetrieverConfig config;
  config.top_k = 3;
  config.text_field = "meta.title";
  const FtsRetriever retriever(store, config);

  const json j = retriever.to_json();
  CHECK(j["type"] == "docvec.retrieval.FtsRetriever");
  CHECK(j["init_parameters"]["text_field"] == "meta.title");
  CHECK(j["init_parameters"]["filters"].is_null());

  const auto restored = fts_retriever_config_from_json(j);
  CHECK(restored.top_k == 3);
  CHECK(restored.text_field == "meta.title");
  CHECK_FALSE(restored.filters.has_value());
}
