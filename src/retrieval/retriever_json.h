#pragma once

// Shared pieces of the retriever JSON forms. Private to src/retrieval.

#include "docvec/filter/filter_json.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace docvec::retrieval::detail {

// Returns the "init_parameters" object after checking "type".
inline const nlohmann::json& init_parameters(const nlohmann::json& j, const char* expected_type) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string() ||
      j["type"].get<std::string>() != expected_type) {
    throw std::invalid_argument(std::string("retriever config: expected type '") + expected_type +
                                "'");
  }
  if (!j.contains("init_parameters") || !j["init_parameters"].is_object()) {
    throw std::invalid_argument("retriever config: missing 'init_parameters' object");
  }
  return j["init_parameters"];
}

inline std::optional<filter::FilterExpr> filters_from(const nlohmann::json& params) {
  if (!params.contains("filters") || params["filters"].is_null()) {
    return std::nullopt;
  }
  return filter::filter_from_json(params["filters"]);
}

inline nlohmann::json filters_to(const std::optional<filter::FilterExpr>& filters) {
  return filters ? filter::filter_to_json(*filters) : nlohmann::json(nullptr);
}

inline std::size_t top_k_from(const nlohmann::json& params, std::size_t fallback) {
  if (!params.contains("top_k")) {
    return fallback;
  }
  if (!params["top_k"].is_number_integer() || params["top_k"].get<std::int64_t>() <= 0) {
    throw std::invalid_argument("retriever config: 'top_k' must be a positive integer");
  }
  return params["top_k"].get<std::size_t>();
}

inline std::size_t require_top_k(std::size_t top_k) {
  if (top_k == 0) {
    throw std::invalid_argument("top_k must be greater than zero");
  }
  return top_k;
}

}  // namespace docvec::retrieval::detail
