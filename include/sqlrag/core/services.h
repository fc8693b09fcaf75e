#pragma once

#include "sqlrag/execution/sql_executor.h"
#include "sqlrag/feedback/feedback_recorder.h"
#include "sqlrag/llm/llm_client.h"
#include "sqlrag/retrieval/example_store.h"
#include "sqlrag/schema/schema_provider.h"
#include "sqlrag/storage/audit_log.h"

namespace sqlrag::core {

// Services is a composition root that bundles the collaborators of a request.
// It holds references (not ownership); the CLI or a test creates the concrete
// instances and keeps them alive for as long as the Services object is used.
struct Services {
  llm::ILlmClient& llm;                   // NOLINT(readability-identifier-naming)
  schema::ISchemaProvider& schema;        // NOLINT(readability-identifier-naming)
  execution::ISqlExecutor& executor;      // NOLINT(readability-identifier-naming)
  retrieval::ExampleStore& examples;      // NOLINT(readability-identifier-naming)
  feedback::FeedbackRecorder& feedback;   // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;          // NOLINT(readability-identifier-naming)

  Services(llm::ILlmClient& llm, schema::ISchemaProvider& schema,
           execution::ISqlExecutor& executor, retrieval::ExampleStore& examples,
           feedback::FeedbackRecorder& feedback, storage::IAuditLog& audit_log)
      : llm(llm),
        schema(schema),
        executor(executor),
        examples(examples),
        feedback(feedback),
        audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace sqlrag::core
