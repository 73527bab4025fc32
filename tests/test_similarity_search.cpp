#include "docvec/core/errors.h"
#include "docvec/filter/filter_expr.h"
#include "docvec/store/document_store.h"

#include "store_fixtures.h"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace docvec;
using Catch::Matchers::WithinAbs;
using docvec::search::DistanceMetric;
using nlohmann::json;

namespace {

store::DocumentStore vector_store() {
  auto store = testing::open_memory_store();
  store.write_documents({
      testing::article("e1", "east", {{"page_number", 1}}, domain::Embedding{1.0f, 0.0f}),
      testing::article("e2", "north", {{"page_number", 2}}, domain::Embedding{0.0f, 1.0f}),
      testing::article("e3", "north-east", {{"page_number", 3}}, domain::Embedding{0.6f, 0.8f}),
      testing::article("none", "no vector", {{"page_number", 4}}),
  });
  return store;
}

}  // namespace

TEST_CASE("similarity_search: l2 orders by ascending distance", "[search][similarity]") {
  auto store = vector_store();
  const auto results = store.similarity_search({1.0f, 0.0f}, 10);

  REQUIRE(results.size() == 3);  // the document without an embedding never matches
  CHECK(testing::ids_of(results) == std::vector<std::string>{"e1", "e3", "e2"});
  CHECK_THAT(*results[0].score, WithinAbs(0.0, 1e-6));
  CHECK_THAT(*results[1].score, WithinAbs(0.8, 1e-6));
  CHECK_THAT(*results[2].score, WithinAbs(2.0, 1e-6));
}

TEST_CASE("similarity_search: top_k truncates", "[search][similarity]") {
  auto store = vector_store();
  const auto results = store.similarity_search({0.0f, 1.0f}, 2);
  CHECK(testing::ids_of(results) == std::vector<std::string>{"e2", "e3"});
}

TEST_CASE("similarity_search: cosine and dot metrics", "[search][similarity]") {
  auto store = vector_store();

  const auto cosine = store.similarity_search({2.0f, 0.0f}, 3, std::nullopt, DistanceMetric::kCosine);
  CHECK(testing::ids_of(cosine) == std::vector<std::string>{"e1", "e3", "e2"});
  CHECK_THAT(*cosine[1].score, WithinAbs(0.4, 1e-6));

  const auto dot = store.similarity_search({0.0f, 1.0f}, 3, std::nullopt, DistanceMetric::kDot);
  CHECK(testing::ids_of(dot) == std::vector<std::string>{"e2", "e3", "e1"});
  CHECK_THAT(*dot[1].score, WithinAbs(0.2, 1e-6));
}

TEST_CASE("similarity_search: filters restrict the candidates", "[search][similarity]") {
  auto store = vector_store();
  const auto results = store.similarity_search({1.0f, 0.0f}, 10, filter::ge("page_number", 2));
  CHECK(testing::ids_of(results) == std::vector<std::string>{"e3", "e2"});

  CHECK(store.similarity_search({1.0f, 0.0f}, 10, filter::gt("page_number", 100)).empty());
}

TEST_CASE("similarity_search: equal distances keep insertion order", "[search][similarity]") {
  auto store = testing::open_memory_store();
  store.write_documents({
      testing::article("b", "", json::object(), domain::Embedding{0.0f, 1.0f}),
      testing::article("a", "", json::object(), domain::Embedding{0.0f, 1.0f}),
      testing::article("c", "", json::object(), domain::Embedding{0.0f, 1.0f}),
  });
  CHECK(testing::ids_of(store.similarity_search({1.0f, 0.0f}, 3)) ==
        std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("similarity_search: an empty store returns nothing", "[search][similarity]") {
  auto store = testing::open_memory_store();
  CHECK(store.similarity_search({1.0f, 0.0f}, 5).empty());
}

TEST_CASE("similarity_search: argument checks", "[search][similarity]") {
  auto store = vector_store();
  CHECK_THROWS_AS(store.similarity_search({1.0f, 0.0f, 0.0f}, 3), core::SchemaMismatch);
  CHECK_THROWS_AS(store.similarity_search({1.0f, 0.0f}, 0), std::invalid_argument);
  CHECK_THROWS_AS(store.similarity_search({1.0f, 0.0f}, 3, filter::eq("embedding", nullptr)),
                  core::UnsupportedFilterError);
}
