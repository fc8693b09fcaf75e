#include "sqlrag/vector/search_backend.h"

#include <algorithm>

namespace sqlrag::vector {

void sort_hits(std::vector<SearchHit>& hits) {
  std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.row < b.row;
  });
}

void FlatSearchBackend::add(const float* data, std::size_t n) {
  data_.insert(data_.end(), data, data + (n * dimension_));  // NOLINT
  count_ += n;
}

std::vector<SearchHit> FlatSearchBackend::search(const Vector& query, std::size_t k) const {
  if (count_ == 0 || k == 0) {
    return {};
  }

  std::vector<SearchHit> hits;
  hits.reserve(count_);
  for (std::size_t row = 0; row < count_; ++row) {
    const float* stored = data_.data() + (row * dimension_);  // NOLINT
    hits.push_back(SearchHit{.row = row, .score = inner_product(query.data(), stored, dimension_)});
  }

  sort_hits(hits);
  if (hits.size() > k) {
    hits.resize(k);
  }
  return hits;
}

}  // namespace sqlrag::vector
