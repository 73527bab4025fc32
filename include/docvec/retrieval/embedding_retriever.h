#pragma once

#include "docvec/filter/filter_expr.h"
#include "docvec/search/distance.h"
#include "docvec/store/document_store.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace docvec::retrieval {

constexpr std::size_t kDefaultTopK = 10;

struct EmbeddingRetrieverConfig {
  std::optional<filter::FilterExpr> filters;                  // NOLINT(readability-identifier-naming)
  std::size_t top_k{kDefaultTopK};                            // NOLINT(readability-identifier-naming)
  search::DistanceMetric metric{search::DistanceMetric::kL2};  // NOLINT(readability-identifier-naming)
};

// Reads {"type": ..., "init_parameters": {"filters", "top_k", "metric"}} as written by
// EmbeddingRetriever::to_json. "document_store" is not read; the caller opens the store.
// Throws std::invalid_argument (or core::UnsupportedFilterError for bad filters).
[[nodiscard]] EmbeddingRetrieverConfig embedding_retriever_config_from_json(const nlohmann::json& j);

// EmbeddingRetriever answers vector queries against one DocumentStore with default
// filters, top_k and metric; per-call arguments take precedence over the defaults.
// The store must outlive the retriever.
class EmbeddingRetriever {
 public:
  // Throws std::invalid_argument when config.top_k is zero.
  explicit EmbeddingRetriever(store::DocumentStore& store, EmbeddingRetrieverConfig config = {});

  // Throws std::invalid_argument for an empty query or a zero top_k, and whatever
  // DocumentStore::similarity_search throws.
  [[nodiscard]] std::vector<domain::Document> retrieve(
      const domain::Embedding& query, std::optional<std::size_t> top_k = std::nullopt,
      const std::optional<filter::FilterExpr>& filters = std::nullopt) const;

  [[nodiscard]] const EmbeddingRetrieverConfig& config() const { return config_; }

  // {"type": "docvec.retrieval.EmbeddingRetriever",
  //  "init_parameters": {"document_store", "filters", "top_k", "metric"}}
  [[nodiscard]] nlohmann::json to_json() const;

 private:
  store::DocumentStore& store_;
  EmbeddingRetrieverConfig config_;
};

}  // namespace docvec::retrieval
