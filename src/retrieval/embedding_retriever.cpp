#include "docvec/retrieval/embedding_retriever.h"

#include "retriever_json.h"

#include <stdexcept>

namespace docvec::retrieval {

namespace {

constexpr const char* kType = "docvec.retrieval.EmbeddingRetriever";

}  // namespace

EmbeddingRetrieverConfig embedding_retriever_config_from_json(const nlohmann::json& j) {
  const auto& params = detail::init_parameters(j, kType);

  EmbeddingRetrieverConfig config;
  config.filters = detail::filters_from(params);
  config.top_k = detail::top_k_from(params, config.top_k);
  if (params.contains("metric")) {
    const auto& name = params["metric"];
    const auto metric =
        name.is_string() ? search::parse_distance_metric(name.get<std::string>()) : std::nullopt;
    if (!metric) {
      throw std::invalid_argument("retriever config: 'metric' must be one of l2, cosine, dot");
    }
    config.metric = *metric;
  }
  return config;
}

EmbeddingRetriever::EmbeddingRetriever(store::DocumentStore& store, EmbeddingRetrieverConfig config)
    : store_(store), config_(std::move(config)) {
  detail::require_top_k(config_.top_k);
}

std::vector<domain::Document> EmbeddingRetriever::retrieve(
    const domain::Embedding& query, std::optional<std::size_t> top_k,
    const std::optional<filter::FilterExpr>& filters) const {
  if (query.empty()) {
    throw std::invalid_argument("query embedding must not be empty");
  }
  const std::size_t k = detail::require_top_k(top_k.value_or(config_.top_k));
  return store_.similarity_search(query, k, filters ? filters : config_.filters, config_.metric);
}

nlohmann::json EmbeddingRetriever::to_json() const {
  return nlohmann::json{
      {"type", kType},
      {"init_parameters",
       {{"document_store", store_.to_json()},
        {"filters", detail::filters_to(config_.filters)},
        {"top_k", config_.top_k},
        {"metric", std::string(search::to_string(config_.metric))}}},
  };
}

}  // namespace docvec::retrieval
