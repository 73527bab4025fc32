#pragma once

#include "docvec/core/result.h"
#include "docvec/domain/document.h"
#include "docvec/filter/filter_expr.h"

#include <cstddef>
#include <string>

namespace docvec::cli {

// Decoders for flag values that carry structure. Each returns the decoded value or a
// message naming what was expected; the option handlers print the message.

// --vector: a non-empty JSON array of numbers.
[[nodiscard]] core::Result<domain::Embedding, std::string> decode_vector(const std::string& text);

// --top-k: a positive decimal integer with nothing after it.
[[nodiscard]] core::Result<std::size_t, std::string> decode_top_k(const std::string& text);

// --filter: the JSON dict format understood by filter_from_json.
[[nodiscard]] core::Result<filter::FilterExpr, std::string> decode_filter(const std::string& text);

}  // namespace docvec::cli
