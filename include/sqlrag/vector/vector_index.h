#pragma once

#include "sqlrag/vector/search_backend.h"
#include "sqlrag/vector/vector_backend.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlrag::vector {

// IndexedDocument is the metadata stored alongside one vector. metadata is always a
// JSON object; the index never interprets it beyond handing it to predicates.
struct IndexedDocument {
  std::string id;           // NOLINT(readability-identifier-naming)
  nlohmann::json metadata;  // NOLINT(readability-identifier-naming)
};

struct ScoredDocument {
  IndexedDocument document;  // NOLINT(readability-identifier-naming)
  double score{0.0};         // NOLINT(readability-identifier-naming)
};

using DocumentPredicate = std::function<bool(const IndexedDocument&)>;

// VectorIndex is an append-only similarity index over unit vectors with a fixed
// dimension. Scores are inner products (cosine similarity for unit vectors).
//
// On-disk layout (one directory):
//   index.bin      "SQLRAGV1", uint64 dimension, uint64 count, count*dimension float32
//   metadata.json  {"format_version", "dimension", "backend", "documents": [{id, ...}]}
// Each file is written to a temporary sibling and renamed into place.
//
// Thread safety: const members may run concurrently; add/load must be serialized by
// the caller and must not overlap with searches.
class VectorIndex {
 public:
  static constexpr std::size_t kDefaultOverfetch = 3;

  // Throws std::invalid_argument when dimension == 0. The requested backend is
  // resolved through probe_backend(); see backend().
  explicit VectorIndex(std::size_t dimension, VectorBackend requested = VectorBackend::kFlat);

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;
  VectorIndex(VectorIndex&&) = default;
  VectorIndex& operator=(VectorIndex&&) = default;
  ~VectorIndex() = default;

  // Appends vectors with their metadata and returns the ids in input order.
  // Without explicit ids, ids are "doc_<row>", skipping any id already taken.
  // Throws core::IndexError (kLengthMismatch, kDimensionMismatch, kDuplicateId,
  // kInvalidMetadata). Every check runs before mutation: a throwing call leaves the
  // index unchanged.
  std::vector<std::string> add(const std::vector<Vector>& vectors,
                               const std::vector<nlohmann::json>& metadata,
                               const std::optional<std::vector<std::string>>& ids = std::nullopt);

  // Returns up to k documents by descending score (ties: insertion order).
  // With a predicate, a candidate pool of k * overfetch is scanned once and filtered;
  // fewer than k matches may come back even when more exist beyond the pool.
  // Throws core::IndexError(kDimensionMismatch) for a query of the wrong size.
  [[nodiscard]] std::vector<ScoredDocument> search(const Vector& query, std::size_t k,
                                                   const DocumentPredicate& predicate = {},
                                                   std::size_t overfetch = kDefaultOverfetch) const;

  // Throws core::PersistenceError on any I/O failure.
  void persist(const std::filesystem::path& dir) const;

  // Replaces the current contents with the persisted state in dir.
  // Missing files leave the index empty. A recorded dimension different from this
  // index's dimension throws core::IndexError(kDimensionMismatch); unreadable or
  // inconsistent files throw core::PersistenceError. On throw the index is unchanged.
  void load(const std::filesystem::path& dir);

  [[nodiscard]] std::size_t count() const { return documents_.size(); }
  [[nodiscard]] std::size_t dimension() const { return dimension_; }
  [[nodiscard]] const BackendProbe& backend() const { return probe_; }
  [[nodiscard]] const std::vector<IndexedDocument>& documents() const { return documents_; }
  [[nodiscard]] bool contains_id(const std::string& id) const { return ids_.count(id) > 0; }

 private:
  std::size_t dimension_;
  BackendProbe probe_;
  std::unique_ptr<ISearchBackend> backend_;
  std::vector<IndexedDocument> documents_;
  std::unordered_set<std::string> ids_;
};

}  // namespace sqlrag::vector
