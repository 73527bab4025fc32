#pragma once

// DistanceMetric: vocabulary for similarity search and the --metric flag.
//
// Every metric is a distance: lower means more similar, and results are ordered
// ascending. Valid flag values: "l2", "cosine", "dot".

#include "docvec/domain/document.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace docvec::search {

enum class DistanceMetric : uint8_t {
  kL2,      // "l2"     squared Euclidean distance (default)
  kCosine,  // "cosine" 1 - cos(a, b); 1.0 when either vector has zero magnitude
  kDot,     // "dot"    1 - dot(a, b)
};

// parse_distance_metric parses a flag value. Case-sensitive; std::nullopt when unrecognised.
[[nodiscard]] inline std::optional<DistanceMetric> parse_distance_metric(std::string_view s) {
  if (s == "l2") {
    return DistanceMetric::kL2;
  }
  if (s == "cosine") {
    return DistanceMetric::kCosine;
  }
  if (s == "dot") {
    return DistanceMetric::kDot;
  }
  return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(DistanceMetric metric) {
  switch (metric) {
    case DistanceMetric::kL2:
      return "l2";
    case DistanceMetric::kCosine:
      return "cosine";
    case DistanceMetric::kDot:
      return "dot";
  }
  return "unknown";  // unreachable
}

// distance computes the metric in double precision.
// Throws std::invalid_argument when the vectors differ in length.
[[nodiscard]] double distance(DistanceMetric metric, const domain::Embedding& a,
                              const domain::Embedding& b);

}  // namespace docvec::search
