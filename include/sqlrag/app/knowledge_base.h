#pragma once

#include "sqlrag/core/clock.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/embedding/embedding_config.h"
#include "sqlrag/embedding/embedding_provider.h"
#include "sqlrag/feedback/feedback_recorder.h"
#include "sqlrag/net/http_client.h"
#include "sqlrag/retrieval/example_store.h"
#include "sqlrag/storage/audit_log.h"
#include "sqlrag/vector/vector_index.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace sqlrag::app {

struct KnowledgeBaseConfig {
  // Persistent directory; without one the knowledge base lives in memory only.
  std::optional<std::filesystem::path> directory;  // NOLINT(readability-identifier-naming)
  embedding::EmbeddingConfig embedding;            // NOLINT(readability-identifier-naming)
  vector::VectorBackend backend{vector::VectorBackend::kFlat};  // NOLINT(readability-identifier-naming)
  retrieval::RetrievalConfig retrieval;                          // NOLINT(readability-identifier-naming)
  // Learned examples are also appended here (JSON array) when set.
  std::optional<std::filesystem::path>
      learned_examples_path;  // NOLINT(readability-identifier-naming)
};

// KnowledgeBase owns the retrieval stack of one process: embedding provider, vector
// index, example store and feedback recorder, constructed in dependency order and
// destroyed in reverse.
//
// Loading: missing files give an empty store. An unreadable or inconsistent
// directory is reported on stderr and also gives an empty store; the directory is
// then never written, so save() and learned examples leave it as found. A dimension
// mismatch between the directory and the embedding provider throws
// core::IndexError (the directory was built with a different provider).
class KnowledgeBase {
 public:
  // http, audit_log, id_gen and clock must outlive the knowledge base.
  KnowledgeBase(KnowledgeBaseConfig config, net::IHttpClient& http, storage::IAuditLog& audit_log,
                core::IIdGenerator& id_gen, core::IClock& clock);

  KnowledgeBase(const KnowledgeBase&) = delete;
  KnowledgeBase& operator=(const KnowledgeBase&) = delete;

  [[nodiscard]] retrieval::ExampleStore& store() { return *store_; }
  [[nodiscard]] const retrieval::ExampleStore& store() const { return *store_; }
  [[nodiscard]] feedback::FeedbackRecorder& feedback() { return *feedback_; }
  [[nodiscard]] const embedding::IEmbeddingProvider& embedder() const { return *embedder_; }
  [[nodiscard]] const vector::VectorIndex& index() const { return *index_; }
  [[nodiscard]] const KnowledgeBaseConfig& config() const { return config_; }

  // True when a directory is configured and loaded cleanly (or was absent).
  [[nodiscard]] bool persistent() const { return config_.directory.has_value() && !load_failed_; }

  // Persists to the configured directory. Returns false when the knowledge base is
  // not persistent. Throws core::PersistenceError.
  bool save() const;

 private:
  KnowledgeBaseConfig config_;
  std::unique_ptr<embedding::IEmbeddingProvider> embedder_;
  std::unique_ptr<vector::VectorIndex> index_;
  std::unique_ptr<retrieval::ExampleStore> store_;
  std::unique_ptr<feedback::FeedbackRecorder> feedback_;
  bool load_failed_{false};
};

}  // namespace sqlrag::app
