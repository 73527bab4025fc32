#include "docvec/retrieval/fts_retriever.h"

#include "retriever_json.h"

#include <stdexcept>

namespace docvec::retrieval {

namespace {

constexpr const char* kType = "docvec.retrieval.FtsRetriever";

}  // namespace

FtsRetrieverConfig fts_retriever_config_from_json(const nlohmann::json& j) {
  const auto& params = detail::init_parameters(j, kType);

  FtsRetrieverConfig config;
  config.filters = detail::filters_from(params);
  config.top_k = detail::top_k_from(params, config.top_k);
  if (params.contains("text_field")) {
    if (!params["text_field"].is_string() || params["text_field"].get<std::string>().empty()) {
      throw std::invalid_argument("retriever config: 'text_field' must be a non-empty string");
    }
    config.text_field = params["text_field"].get<std::string>();
  }
  return config;
}

FtsRetriever::FtsRetriever(store::DocumentStore& store, FtsRetrieverConfig config)
    : store_(store), config_(std::move(config)) {
  detail::require_top_k(config_.top_k);
}

std::vector<domain::Document> FtsRetriever::retrieve(
    std::string_view query, std::optional<std::size_t> top_k,
    const std::optional<filter::FilterExpr>& filters) const {
  if (query.empty()) {
    throw std::invalid_argument("query must not be empty");
  }
  const std::size_t k = detail::require_top_k(top_k.value_or(config_.top_k));
  return store_.text_search(query, k, filters ? filters : config_.filters, config_.text_field);
}

nlohmann::json FtsRetriever::to_json() const {
  return nlohmann::json{
      {"type", kType},
      {"init_parameters",
       {{"document_store", store_.to_json()},
        {"filters", detail::filters_to(config_.filters)},
        {"top_k", config_.top_k},
        {"text_field", config_.text_field}}},
  };
}

}  // namespace docvec::retrieval
