#include "sqlrag/vector/vector_index.h"

#include "sqlrag/core/errors.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace sqlrag::vector {

namespace {

constexpr std::array<char, 8> kIndexMagic = {'S', 'Q', 'L', 'R', 'A', 'G', 'V', '1'};
constexpr int kMetadataFormatVersion = 1;
constexpr const char* kIndexFile = "index.bin";
constexpr const char* kMetadataFile = "metadata.json";

using core::IndexError;
using core::IndexErrorKind;
using core::PersistenceError;

// Writes bytes to <path>.tmp and renames it over path.
void write_atomically(const std::filesystem::path& path, const std::string& bytes) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw PersistenceError("cannot open '" + tmp.string() + "' for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      throw PersistenceError("short write to '" + tmp.string() + "'");
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw PersistenceError("cannot replace '" + path.string() + "'");
  }
}

template <typename T>
void append_pod(std::string& out, const T& value) {
  const auto* bytes = reinterpret_cast<const char*>(&value);  // NOLINT
  out.append(bytes, sizeof(T));
}

template <typename T>
bool read_pod(std::istream& in, T& value) {
  in.read(reinterpret_cast<char*>(&value), sizeof(T));  // NOLINT
  return static_cast<bool>(in);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

VectorIndex::VectorIndex(std::size_t dimension, VectorBackend requested)
    : dimension_(dimension), probe_(probe_backend(requested)) {
  if (dimension == 0) {
    throw std::invalid_argument("VectorIndex: dimension must be greater than 0");
  }
  backend_ = make_search_backend(probe_.selected, dimension_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> VectorIndex::add(const std::vector<Vector>& vectors,
                                          const std::vector<nlohmann::json>& metadata,
                                          const std::optional<std::vector<std::string>>& ids) {
  if (vectors.size() != metadata.size()) {
    throw IndexError(IndexErrorKind::kLengthMismatch,
                     "add: " + std::to_string(vectors.size()) + " vectors but " +
                         std::to_string(metadata.size()) + " metadata entries");
  }
  if (ids.has_value() && ids->size() != vectors.size()) {
    throw IndexError(IndexErrorKind::kLengthMismatch,
                     "add: " + std::to_string(vectors.size()) + " vectors but " +
                         std::to_string(ids->size()) + " ids");
  }
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension_) {
      throw IndexError(IndexErrorKind::kDimensionMismatch,
                       "add: vector " + std::to_string(i) + " has dimension " +
                           std::to_string(vectors[i].size()) + ", index expects " +
                           std::to_string(dimension_));
    }
    if (!metadata[i].is_object()) {
      throw IndexError(IndexErrorKind::kInvalidMetadata,
                       "add: metadata " + std::to_string(i) + " is not a JSON object");
    }
  }

  std::vector<std::string> assigned;
  assigned.reserve(vectors.size());
  if (ids.has_value()) {
    std::unordered_set<std::string> batch;
    for (const auto& id : *ids) {
      if (id.empty() || ids_.count(id) > 0 || !batch.insert(id).second) {
        throw IndexError(IndexErrorKind::kDuplicateId, "add: duplicate or empty id '" + id + "'");
      }
      assigned.push_back(id);
    }
  } else {
    std::size_t next = documents_.size();
    for (std::size_t i = 0; i < vectors.size(); ++i) {
      std::string candidate;
      do {
        candidate = "doc_" + std::to_string(next++);
      } while (ids_.count(candidate) > 0);
      assigned.push_back(std::move(candidate));
    }
  }

  if (vectors.empty()) {
    return assigned;
  }

  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension_);
  for (const auto& v : vectors) {
    flat.insert(flat.end(), v.begin(), v.end());
  }
  backend_->add(flat.data(), vectors.size());

  for (std::size_t i = 0; i < vectors.size(); ++i) {
    ids_.insert(assigned[i]);
    documents_.push_back(IndexedDocument{.id = assigned[i], .metadata = metadata[i]});
  }
  return assigned;
}

// ─────────────────────────────────────────────────────────────────────────────
// Search
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ScoredDocument> VectorIndex::search(const Vector& query, std::size_t k,
                                                const DocumentPredicate& predicate,
                                                std::size_t overfetch) const {
  if (query.size() != dimension_) {
    throw IndexError(IndexErrorKind::kDimensionMismatch,
                     "search: query has dimension " + std::to_string(query.size()) +
                         ", index expects " + std::to_string(dimension_));
  }
  if (documents_.empty() || k == 0) {
    return {};
  }

  const std::size_t pool =
      predicate ? std::min(documents_.size(), k * std::max<std::size_t>(overfetch, 1))
                : std::min(documents_.size(), k);

  std::vector<ScoredDocument> results;
  results.reserve(std::min(k, pool));
  for (const auto& hit : backend_->search(query, pool)) {
    const IndexedDocument& doc = documents_.at(hit.row);
    if (predicate && !predicate(doc)) {
      continue;
    }
    results.push_back(ScoredDocument{.document = doc, .score = hit.score});
    if (results.size() == k) {
      break;
    }
  }
  return results;
}

// ─────────────────────────────────────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────────────────────────────────────

void VectorIndex::persist(const std::filesystem::path& dir) const {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw PersistenceError("cannot create '" + dir.string() + "': " + ec.message());
  }

  const std::vector<float> data = backend_->export_all();

  std::string blob;
  blob.reserve(kIndexMagic.size() + (2 * sizeof(std::uint64_t)) + (data.size() * sizeof(float)));
  blob.append(kIndexMagic.data(), kIndexMagic.size());
  append_pod(blob, static_cast<std::uint64_t>(dimension_));
  append_pod(blob, static_cast<std::uint64_t>(documents_.size()));
  blob.append(reinterpret_cast<const char*>(data.data()), data.size() * sizeof(float));  // NOLINT

  nlohmann::json meta;
  meta["format_version"] = kMetadataFormatVersion;
  meta["dimension"] = dimension_;
  meta["backend"] = std::string(to_string(probe_.selected));
  meta["documents"] = nlohmann::json::array();
  for (const auto& doc : documents_) {
    nlohmann::json entry = doc.metadata;
    entry["id"] = doc.id;
    meta["documents"].push_back(std::move(entry));
  }

  // Vectors first: a crash between the two renames leaves a count mismatch that
  // load() reports instead of silently pairing old metadata with new vectors.
  write_atomically(dir / kIndexFile, blob);
  write_atomically(dir / kMetadataFile, meta.dump(2));
}

void VectorIndex::load(const std::filesystem::path& dir) {
  const auto index_path = dir / kIndexFile;
  const auto meta_path = dir / kMetadataFile;

  if (!std::filesystem::exists(index_path) || !std::filesystem::exists(meta_path)) {
    backend_ = make_search_backend(probe_.selected, dimension_);
    documents_.clear();
    ids_.clear();
    return;
  }

  // ── metadata.json ───────────────────────────────────────────────────────────
  std::ifstream meta_in(meta_path);
  if (!meta_in) {
    throw PersistenceError("cannot read '" + meta_path.string() + "'");
  }
  const auto meta = nlohmann::json::parse(meta_in, nullptr, false);
  if (meta.is_discarded() || !meta.is_object()) {
    throw PersistenceError("'" + meta_path.string() + "' is not valid JSON");
  }
  if (!meta.contains("dimension") || !meta.at("dimension").is_number_unsigned() ||
      !meta.contains("documents") || !meta.at("documents").is_array()) {
    throw PersistenceError("'" + meta_path.string() + "' lacks dimension or documents");
  }
  const auto recorded_dim = meta.at("dimension").get<std::size_t>();
  if (recorded_dim != dimension_) {
    throw IndexError(IndexErrorKind::kDimensionMismatch,
                     "knowledge base at '" + dir.string() + "' has dimension " +
                         std::to_string(recorded_dim) + ", embedding provider produces " +
                         std::to_string(dimension_));
  }

  std::vector<IndexedDocument> documents;
  std::unordered_set<std::string> ids;
  for (const auto& entry : meta.at("documents")) {
    if (!entry.is_object() || !entry.contains("id") || !entry.at("id").is_string()) {
      throw PersistenceError("'" + meta_path.string() + "' has a document without an id");
    }
    IndexedDocument doc{.id = entry.at("id").get<std::string>(), .metadata = entry};
    doc.metadata.erase("id");
    if (!ids.insert(doc.id).second) {
      throw PersistenceError("'" + meta_path.string() + "' repeats id '" + doc.id + "'");
    }
    documents.push_back(std::move(doc));
  }

  // ── index.bin ───────────────────────────────────────────────────────────────
  std::ifstream bin(index_path, std::ios::binary);
  if (!bin) {
    throw PersistenceError("cannot read '" + index_path.string() + "'");
  }
  std::array<char, kIndexMagic.size()> magic{};
  bin.read(magic.data(), magic.size());
  if (!bin || magic != kIndexMagic) {
    throw PersistenceError("'" + index_path.string() + "' is not a sqlrag vector file");
  }
  std::uint64_t file_dim = 0;
  std::uint64_t file_count = 0;
  if (!read_pod(bin, file_dim) || !read_pod(bin, file_count)) {
    throw PersistenceError("'" + index_path.string() + "' has a truncated header");
  }
  if (file_dim != dimension_) {
    throw IndexError(IndexErrorKind::kDimensionMismatch,
                     "'" + index_path.string() + "' holds vectors of dimension " +
                         std::to_string(file_dim) + ", expected " + std::to_string(dimension_));
  }
  if (file_count != documents.size()) {
    throw PersistenceError("'" + index_path.string() + "' holds " + std::to_string(file_count) +
                           " vectors but metadata lists " + std::to_string(documents.size()) +
                           " documents");
  }

  std::vector<float> data(static_cast<std::size_t>(file_count) * dimension_);
  bin.read(reinterpret_cast<char*>(data.data()),  // NOLINT
           static_cast<std::streamsize>(data.size() * sizeof(float)));
  if (!bin) {
    throw PersistenceError("'" + index_path.string() + "' is truncated");
  }

  auto backend = make_search_backend(probe_.selected, dimension_);
  if (file_count > 0) {
    backend->add(data.data(), static_cast<std::size_t>(file_count));
  }

  backend_ = std::move(backend);
  documents_ = std::move(documents);
  ids_ = std::move(ids);
}

}  // namespace sqlrag::vector
