#include "cli_options_logic.h"

#include "docvec/core/errors.h"
#include "docvec/filter/filter_json.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace docvec::cli {

core::Result<domain::Embedding, std::string> decode_vector(const std::string& text) {
  using Out = core::Result<domain::Embedding, std::string>;
  const std::string expected = "expected a non-empty JSON array of numbers";

  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array() || parsed.empty()) {
    return Out::err(expected);
  }
  domain::Embedding vector;
  vector.reserve(parsed.size());
  for (const auto& value : parsed) {
    if (!value.is_number()) {
      return Out::err(expected + ", got " + value.dump());
    }
    vector.push_back(value.get<float>());
  }
  return Out::ok(std::move(vector));
}

core::Result<std::size_t, std::string> decode_top_k(const std::string& text) {
  using Out = core::Result<std::size_t, std::string>;

  std::size_t parsed = 0;
  std::size_t consumed = 0;
  // stoul accepts a leading '-' and wraps it; only digits are valid here.
  if (!text.empty() && text[0] >= '0' && text[0] <= '9') {
    try {
      parsed = std::stoul(text, &consumed);
    } catch (const std::logic_error&) {
      consumed = 0;
    }
  }
  if (consumed == 0 || consumed != text.size() || parsed == 0) {
    return Out::err(text + " (expected a positive integer)");
  }
  return Out::ok(parsed);
}

core::Result<filter::FilterExpr, std::string> decode_filter(const std::string& text) {
  using Out = core::Result<filter::FilterExpr, std::string>;

  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return Out::err("not valid JSON");
  }
  try {
    return Out::ok(filter::filter_from_json(parsed));
  } catch (const core::UnsupportedFilterError& e) {
    return Out::err(e.what());
  }
}

}  // namespace docvec::cli
