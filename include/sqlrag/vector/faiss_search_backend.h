#pragma once

#include "sqlrag/vector/search_backend.h"

#include <memory>

namespace faiss {
struct IndexFlatIP;
}  // namespace faiss

namespace sqlrag::vector {

// FaissSearchBackend wraps faiss::IndexFlatIP (exact inner product, SIMD scan).
// Only compiled when the build found FAISS (SQLRAG_HAVE_FAISS); selection goes
// through probe_backend() so callers never reference it directly.
class FaissSearchBackend final : public ISearchBackend {
 public:
  explicit FaissSearchBackend(std::size_t dimension);
  ~FaissSearchBackend() override;

  FaissSearchBackend(const FaissSearchBackend&) = delete;
  FaissSearchBackend& operator=(const FaissSearchBackend&) = delete;
  FaissSearchBackend(FaissSearchBackend&&) = delete;
  FaissSearchBackend& operator=(FaissSearchBackend&&) = delete;

  void add(const float* data, std::size_t n) override;
  [[nodiscard]] std::vector<SearchHit> search(const Vector& query, std::size_t k) const override;
  [[nodiscard]] std::size_t size() const override;
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }
  [[nodiscard]] std::vector<float> export_all() const override;

 private:
  std::size_t dimension_;
  std::unique_ptr<faiss::IndexFlatIP> index_;
};

}  // namespace sqlrag::vector
