#pragma once

#include "sqlrag/domain/example.h"
#include "sqlrag/embedding/embedding_provider.h"
#include "sqlrag/vector/vector_index.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlrag::retrieval {

struct RetrievalConfig {
  // Candidates requested from the index per wanted result (before schema filtering).
  std::size_t overfetch_multiplier{3};  // NOLINT(readability-identifier-naming)
  // Score penalty per step of complexity-rank distance.
  double complexity_penalty{0.1};  // NOLINT(readability-identifier-naming)
  // k used by generation prompts when the caller does not choose one.
  std::size_t default_k{3};  // NOLINT(readability-identifier-naming)
};

struct RetrievalQuery {
  std::string text;                                       // NOLINT(readability-identifier-naming)
  std::optional<std::set<std::string>> relevant_tables;   // NOLINT(readability-identifier-naming)
  std::size_t k{3};                                       // NOLINT(readability-identifier-naming)
  std::optional<domain::Complexity> complexity_hint;      // NOLINT(readability-identifier-naming)
};

// score is the semantic (cosine) similarity; adjusted_score is what ordering uses and
// equals score when no complexity hint was given.
struct ScoredExample {
  domain::Example example;  // NOLINT(readability-identifier-naming)
  double score{0.0};        // NOLINT(readability-identifier-naming)
  double adjusted_score{0.0};  // NOLINT(readability-identifier-naming)
};

// ExampleStore is the retrieval API over the knowledge base: an embedding provider
// plus a vector index whose metadata are Examples.
//
// The store borrows both collaborators; they must outlive it. Callers serialize
// add/load/save (FeedbackRecorder does this for the feedback path).
class ExampleStore {
 public:
  // Throws core::IndexError(kDimensionMismatch) if the provider and index disagree.
  ExampleStore(embedding::IEmbeddingProvider& embedder, vector::VectorIndex& index,
               RetrievalConfig config = {});

  // Retrieval policy:
  //   1. empty store -> empty result, without embedding
  //   2. embed query.text (core::EmbeddingError propagates)
  //   3. search k * overfetch candidates; with non-empty relevant_tables keep only
  //      examples sharing at least one table
  //   4. with a complexity hint, adjusted = score - penalty * |rank(hint) - rank(doc)|
  //      and stable-sort by adjusted score
  //   5. truncate to k
  [[nodiscard]] std::vector<ScoredExample> retrieve(const RetrievalQuery& query) const;

  // Embeds and appends examples whose SQL text is new to the store (exact string
  // match against stored examples and earlier items of the same batch).
  // Returns the ids of the examples actually added. One embed_batch call per add.
  std::vector<std::string> add(const std::vector<domain::Example>& examples);

  [[nodiscard]] bool contains_sql(const std::string& sql) const { return sqls_.count(sql) > 0; }

  [[nodiscard]] std::size_t count() const { return index_.count(); }

  // All stored examples in insertion order (ids populated).
  [[nodiscard]] std::vector<domain::Example> list() const;

  void save(const std::filesystem::path& dir) const { index_.persist(dir); }

  // Loads the index from dir and rebuilds the SQL dedup set.
  void load(const std::filesystem::path& dir);

  [[nodiscard]] const RetrievalConfig& config() const { return config_; }
  [[nodiscard]] const embedding::IEmbeddingProvider& embedder() const { return embedder_; }

 private:
  void rebuild_sql_set();

  embedding::IEmbeddingProvider& embedder_;
  vector::VectorIndex& index_;
  RetrievalConfig config_;
  std::unordered_set<std::string> sqls_;
};

// Renders results as the "Similar SQL Examples" prompt block. Empty input -> "".
[[nodiscard]] std::string format_examples_for_prompt(const std::vector<ScoredExample>& results);

// Converts a stored document back into an Example (id from the document).
// Documents written by this store always convert; foreign metadata yields nullopt.
[[nodiscard]] std::optional<domain::Example> example_from_document(
    const vector::IndexedDocument& doc);

}  // namespace sqlrag::retrieval
