#include "sqlrag/vector/faiss_search_backend.h"

#include <faiss/IndexFlat.h>

#include <algorithm>

namespace sqlrag::vector {

FaissSearchBackend::FaissSearchBackend(std::size_t dimension)
    : dimension_(dimension),
      index_(std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension))) {}

// Defined here so the unique_ptr deleter sees the complete faiss type.
FaissSearchBackend::~FaissSearchBackend() = default;

void FaissSearchBackend::add(const float* data, std::size_t n) {
  index_->add(static_cast<faiss::idx_t>(n), data);
}

std::vector<SearchHit> FaissSearchBackend::search(const Vector& query, std::size_t k) const {
  const auto total = static_cast<std::size_t>(index_->ntotal);
  const std::size_t wanted = std::min(k, total);
  if (wanted == 0) {
    return {};
  }

  // Ask for one extra neighbour when possible so that a tie at the cut-off can be
  // resolved by row order rather than by FAISS's internal heap order.
  const std::size_t fetch = std::min(total, wanted + 1);
  std::vector<float> distances(fetch);
  std::vector<faiss::idx_t> labels(fetch);
  index_->search(1, query.data(), static_cast<faiss::idx_t>(fetch), distances.data(),
                 labels.data());

  std::vector<SearchHit> hits;
  hits.reserve(fetch);
  for (std::size_t i = 0; i < fetch; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    hits.push_back(SearchHit{.row = static_cast<std::size_t>(labels[i]),
                             .score = static_cast<double>(distances[i])});
  }

  sort_hits(hits);
  if (hits.size() > wanted) {
    hits.resize(wanted);
  }
  return hits;
}

std::size_t FaissSearchBackend::size() const {
  return static_cast<std::size_t>(index_->ntotal);
}

std::vector<float> FaissSearchBackend::export_all() const {
  std::vector<float> out(size() * dimension_);
  if (!out.empty()) {
    index_->reconstruct_n(0, index_->ntotal, out.data());
  }
  return out;
}

}  // namespace sqlrag::vector
