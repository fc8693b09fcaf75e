#pragma once

#include "sqlrag/vector/vector_math.h"

#include <cstddef>
#include <vector>

namespace sqlrag::vector {

// SearchHit identifies a stored vector by its insertion row.
struct SearchHit {
  std::size_t row{0};  // NOLINT(readability-identifier-naming)
  double score{0.0};   // NOLINT(readability-identifier-naming)
};

// ISearchBackend is the exhaustive inner-product engine behind VectorIndex.
// Rows are assigned contiguously in insertion order starting at 0.
// search returns at most k hits ordered by score descending; equal scores are
// ordered by ascending row so that earlier insertions win ties on every backend.
// Inputs are pre-validated by VectorIndex (dimension, count).
class ISearchBackend {
 public:
  virtual ~ISearchBackend() = default;

  // Appends n row-major vectors of dimension() floats each.
  virtual void add(const float* data, std::size_t n) = 0;

  [[nodiscard]] virtual std::vector<SearchHit> search(const Vector& query, std::size_t k) const = 0;

  [[nodiscard]] virtual std::size_t size() const = 0;
  [[nodiscard]] virtual std::size_t dimension() const = 0;

  // Copies every stored vector, row-major, into a contiguous buffer.
  [[nodiscard]] virtual std::vector<float> export_all() const = 0;
};

// Shared ordering used by every backend: score desc, ties by row asc.
void sort_hits(std::vector<SearchHit>& hits);

// FlatSearchBackend keeps vectors in one contiguous float buffer and scans it.
// Reference implementation; always available.
class FlatSearchBackend final : public ISearchBackend {
 public:
  explicit FlatSearchBackend(std::size_t dimension) : dimension_(dimension) {}

  void add(const float* data, std::size_t n) override;
  [[nodiscard]] std::vector<SearchHit> search(const Vector& query, std::size_t k) const override;
  [[nodiscard]] std::size_t size() const override { return count_; }
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }
  [[nodiscard]] std::vector<float> export_all() const override { return data_; }

 private:
  std::size_t dimension_;
  std::size_t count_{0};
  std::vector<float> data_;
};

}  // namespace sqlrag::vector
