#pragma once

#include "sqlrag/app/knowledge_base.h"
#include "sqlrag/core/clock.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/ingest/example_generator.h"
#include "sqlrag/storage/audit_log.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sqlrag::app {

// ────────────────────────────────────────────────────────────────
// Knowledge-base initialization
// ────────────────────────────────────────────────────────────────

struct KbInitRequest {
  bool include_base{true};                               // NOLINT(readability-identifier-naming)
  std::vector<std::filesystem::path> example_paths;      // NOLINT(readability-identifier-naming)
  // LLM generation runs when generate_count > 0 and schema_text is set.
  std::size_t generate_count{0};                         // NOLINT(readability-identifier-naming)
  std::optional<std::string> schema_text;                // NOLINT(readability-identifier-naming)
  // Generated examples are merged into this JSON file when set.
  std::optional<std::filesystem::path>
      generated_examples_path;                           // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;                   // NOLINT(readability-identifier-naming)
};

struct KbInitResponse {
  std::string trace_id;             // NOLINT(readability-identifier-naming)
  std::size_t base_count{0};        // NOLINT(readability-identifier-naming)
  std::size_t file_count{0};        // NOLINT(readability-identifier-naming)
  std::size_t generated_count{0};   // NOLINT(readability-identifier-naming)
  std::size_t skipped{0};           // NOLINT(readability-identifier-naming)
  std::size_t added{0};             // NOLINT(readability-identifier-naming)
  std::size_t total{0};             // NOLINT(readability-identifier-naming)
  bool saved{false};                // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)
};

// Collects base, file and generated examples, adds them to the knowledge base (SQL
// duplicates are skipped) and persists it.
// generator may be null when no generation is requested.
// Emits audit event: ExamplesIngested.
// Throws core::EmbeddingError, core::PersistenceError, core::LlmUnavailableError.
[[nodiscard]] KbInitResponse run_kb_init_pipeline(const KbInitRequest& req, KnowledgeBase& kb,
                                                  ingest::ExampleGenerator* generator,
                                                  storage::IAuditLog& audit_log,
                                                  core::IIdGenerator& id_gen, core::IClock& clock);

}  // namespace sqlrag::app
