#pragma once

#include "sqlrag/app/app_service.h"

// execute_kb_init: run the initialization pipeline and print the counts.
int execute_kb_init(const sqlrag::app::KbInitRequest& request, sqlrag::app::KnowledgeBase& kb,
                    sqlrag::ingest::ExampleGenerator* generator,
                    sqlrag::storage::IAuditLog& audit_log, sqlrag::core::IIdGenerator& id_gen,
                    sqlrag::core::IClock& clock);
