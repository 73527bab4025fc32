#pragma once

#include "docvec/filter/filter_expr.h"

#include <nlohmann/json.hpp>

namespace docvec::filter {

// filter_from_json parses the retrieval pipeline's filter dictionaries:
//   {"field": "meta.page", "operator": ">", "value": 5}
//   {"operator": "AND", "conditions": [ ... ]}
// Throws core::UnsupportedFilterError on malformed input or unknown operators.
// Field names and value types are checked later, against a table, by FilterTranslator.
[[nodiscard]] FilterExpr filter_from_json(const nlohmann::json& j);

// filter_to_json is the inverse of filter_from_json.
[[nodiscard]] nlohmann::json filter_to_json(const FilterExpr& expr);

}  // namespace docvec::filter
