#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace agentwatch::embedding {

// dot(a, b) / (|a| * |b|). Returns 0 when either vector is empty or zero, or
// when the lengths differ.
inline double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  const double norm = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (norm == 0.0) {
    return 0.0;
  }
  return dot / norm;
}

// Scales `vector` to unit length in place; a zero vector is left unchanged.
inline void NormalizeL2(std::vector<float>& vector) {
  double sum_squares = 0.0;
  for (const float component : vector) {
    sum_squares += static_cast<double>(component) * static_cast<double>(component);
  }
  if (sum_squares == 0.0) {
    return;
  }
  const double inverse_norm = 1.0 / std::sqrt(sum_squares);
  for (float& component : vector) {
    component = static_cast<float>(static_cast<double>(component) * inverse_norm);
  }
}

} // namespace agentwatch::embedding
