#include "sqlrag/app/app_service.h"

#include "sqlrag/ingest/example_loader.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace sqlrag::app {

KbInitResponse run_kb_init_pipeline(const KbInitRequest& req, KnowledgeBase& kb,
                                    ingest::ExampleGenerator* generator,
                                    storage::IAuditLog& audit_log, core::IIdGenerator& id_gen,
                                    core::IClock& clock) {
  KbInitResponse response;
  response.trace_id = req.trace_id.value_or(id_gen.next("trace"));

  std::vector<domain::Example> all_examples;

  if (req.include_base) {
    auto base = ingest::base_examples();
    response.base_count = base.size();
    all_examples.insert(all_examples.end(), base.begin(), base.end());
  }

  for (const auto& path : req.example_paths) {
    auto report = ingest::load_examples_from_path(path);
    response.file_count += report.examples.size();
    response.skipped += report.skipped;
    response.errors.insert(response.errors.end(), report.errors.begin(), report.errors.end());
    all_examples.insert(all_examples.end(), report.examples.begin(), report.examples.end());
  }

  if (generator != nullptr && req.generate_count > 0 && req.schema_text.has_value()) {
    auto generated = generator->generate(*req.schema_text, req.generate_count);
    response.generated_count = generated.size();
    if (req.generated_examples_path.has_value() && !generated.empty()) {
      ingest::save_examples_to_file(generated, *req.generated_examples_path);
    }
    all_examples.insert(all_examples.end(), generated.begin(), generated.end());
  }

  std::vector<std::string> ids;
  if (!all_examples.empty()) {
    ids = kb.store().add(all_examples);
  }
  response.added = ids.size();
  response.saved = kb.save();
  response.total = kb.store().count();

  for (const auto& error : response.errors) {
    std::cerr << "Warning: " << error << "\n";
  }

  const nlohmann::json payload = {{"base", response.base_count},
                                  {"files", response.file_count},
                                  {"generated", response.generated_count},
                                  {"skipped", response.skipped},
                                  {"added", response.added},
                                  {"total", response.total},
                                  {"saved", response.saved}};
  audit_log.append({id_gen.next("evt"), response.trace_id, "ExamplesIngested", payload.dump(),
                    clock.now_iso8601(), ids});

  return response;
}

}  // namespace sqlrag::app
