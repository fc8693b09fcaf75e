#include "kb_init_logic.h"

#include "sqlrag/core/errors.h"

#include <iostream>

int execute_kb_init(const sqlrag::app::KbInitRequest& request, sqlrag::app::KnowledgeBase& kb,
                    sqlrag::ingest::ExampleGenerator* generator,
                    sqlrag::storage::IAuditLog& audit_log, sqlrag::core::IIdGenerator& id_gen,
                    sqlrag::core::IClock& clock) {
  sqlrag::app::KbInitResponse result;
  try {
    result = sqlrag::app::run_kb_init_pipeline(request, kb, generator, audit_log, id_gen, clock);
  } catch (const sqlrag::core::LlmUnavailableError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const sqlrag::core::EmbeddingError& e) {
    std::cerr << "Error: embedding failed, nothing was added: " << e.what() << "\n";
    return 1;
  } catch (const sqlrag::core::PersistenceError& e) {
    std::cerr << "Error: knowledge base could not be saved: " << e.what() << "\n";
    return 1;
  }

  std::cout << "Knowledge base initialized:\n";
  std::cout << "  trace_id:  " << result.trace_id << "\n";
  std::cout << "  base:      " << result.base_count << "\n";
  std::cout << "  files:     " << result.file_count << " (skipped " << result.skipped << ")\n";
  std::cout << "  generated: " << result.generated_count << "\n";
  std::cout << "  added:     " << result.added << "\n";
  std::cout << "  total:     " << result.total << "\n";
  std::cout << "  saved:     " << (result.saved ? "yes" : "no") << "\n";

  return result.errors.empty() ? 0 : 1;
}
