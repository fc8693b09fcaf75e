#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace sqlrag::vector {

using Vector = std::vector<float>;

// Dot product accumulated in double. Returns 0.0 when sizes differ.
[[nodiscard]] inline double inner_product(const float* a, const float* b, const std::size_t n) {
  double dot = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);  // NOLINT
  }
  return dot;
}

[[nodiscard]] inline double inner_product(const Vector& a, const Vector& b) {
  if (a.size() != b.size()) {
    return 0.0;
  }
  return inner_product(a.data(), b.data(), a.size());
}

[[nodiscard]] inline double l2_norm(const Vector& v) {
  return std::sqrt(inner_product(v, v));
}

// Scales v to unit length in place. Returns false (leaving v unchanged) for a zero vector.
inline bool l2_normalize(Vector& v) {
  const double norm = l2_norm(v);
  if (norm <= 0.0) {
    return false;
  }
  for (float& x : v) {
    x = static_cast<float>(static_cast<double>(x) / norm);
  }
  return true;
}

}  // namespace sqlrag::vector
