#pragma once

#include "docvec/filter/filter_expr.h"
#include "docvec/retrieval/embedding_retriever.h"
#include "docvec/store/document_store.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::retrieval {

struct FtsRetrieverConfig {
  std::optional<filter::FilterExpr> filters;   // NOLINT(readability-identifier-naming)
  std::size_t top_k{kDefaultTopK};             // NOLINT(readability-identifier-naming)
  std::string text_field{schema::kContentColumn};  // NOLINT(readability-identifier-naming)
};

// Reads {"type": ..., "init_parameters": {"filters", "top_k", "text_field"}}.
[[nodiscard]] FtsRetrieverConfig fts_retriever_config_from_json(const nlohmann::json& j);

// FtsRetriever answers keyword queries through the store's full-text index.
// The store must outlive the retriever.
class FtsRetriever {
 public:
  // Throws std::invalid_argument when config.top_k is zero.
  explicit FtsRetriever(store::DocumentStore& store, FtsRetrieverConfig config = {});

  // Throws std::invalid_argument for an empty query or a zero top_k, and whatever
  // DocumentStore::text_search throws.
  [[nodiscard]] std::vector<domain::Document> retrieve(
      std::string_view query, std::optional<std::size_t> top_k = std::nullopt,
      const std::optional<filter::FilterExpr>& filters = std::nullopt) const;

  [[nodiscard]] const FtsRetrieverConfig& config() const { return config_; }

  [[nodiscard]] nlohmann::json to_json() const;

 private:
  store::DocumentStore& store_;
  FtsRetrieverConfig config_;
};

}  // namespace docvec::retrieval
