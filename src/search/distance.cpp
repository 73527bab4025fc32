#include "docvec/search/distance.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace docvec::search {

namespace {

double squared_l2(const domain::Embedding& a, const domain::Embedding& b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    sum += diff * diff;
  }
  return sum;
}

double dot_product(const domain::Embedding& a, const domain::Embedding& b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

double cosine_distance(const domain::Embedding& a, const domain::Embedding& b) {
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 1.0;
  }
  return 1.0 - dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace

double distance(DistanceMetric metric, const domain::Embedding& a, const domain::Embedding& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("distance: vectors have " + std::to_string(a.size()) + " and " +
                                std::to_string(b.size()) + " dimensions");
  }

  switch (metric) {
    case DistanceMetric::kL2:
      return squared_l2(a, b);
    case DistanceMetric::kCosine:
      return cosine_distance(a, b);
    case DistanceMetric::kDot:
      return 1.0 - dot_product(a, b);
  }
  return squared_l2(a, b);  // unreachable
}

}  // namespace docvec::search
