#include "sqlrag/app/knowledge_base.h"

#include "sqlrag/core/errors.h"
#include "sqlrag/embedding/http_embedding_provider.h"

#include <iostream>

namespace sqlrag::app {

KnowledgeBase::KnowledgeBase(KnowledgeBaseConfig config, net::IHttpClient& http,
                             storage::IAuditLog& audit_log, core::IIdGenerator& id_gen,
                             core::IClock& clock)
    : config_(std::move(config)) {
  embedder_ = embedding::make_embedding_provider(config_.embedding, http);
  index_ = std::make_unique<vector::VectorIndex>(embedder_->dimension(), config_.backend);
  if (index_->backend().fell_back()) {
    std::cerr << "Warning: vector backend '" << vector::to_string(index_->backend().requested)
              << "' is not available in this build; using '"
              << vector::to_string(index_->backend().selected) << "'\n";
  }

  store_ = std::make_unique<retrieval::ExampleStore>(*embedder_, *index_, config_.retrieval);

  if (config_.directory.has_value()) {
    try {
      store_->load(*config_.directory);
    } catch (const core::PersistenceError& e) {
      load_failed_ = true;
      std::cerr << "Warning: knowledge base at '" << config_.directory->string()
                << "' could not be loaded, starting empty: " << e.what() << "\n"
                << "Warning: existing files are left untouched; learned examples stay in memory\n";
    }
  }

  std::optional<std::filesystem::path> kb_dir;
  if (!load_failed_) {
    kb_dir = config_.directory;
  }
  feedback_ = std::make_unique<feedback::FeedbackRecorder>(
      *store_, audit_log, id_gen, clock,
      feedback::FeedbackConfig{.kb_dir = std::move(kb_dir),
                               .learned_examples_path = config_.learned_examples_path});
}

bool KnowledgeBase::save() const {
  if (!persistent()) {
    return false;
  }
  store_->save(*config_.directory);
  return true;
}

}  // namespace sqlrag::app
