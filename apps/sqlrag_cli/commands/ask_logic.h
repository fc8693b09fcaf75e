#pragma once

#include "sqlrag/core/clock.h"
#include "sqlrag/core/id_generator.h"
#include "sqlrag/core/services.h"
#include "sqlrag/workflow/workflow_engine.h"

// execute_ask: run one request through the workflow engine and print the answer.
// Takes only interface types; concrete collaborators are wired by cmd_ask.
// Returns 0 on DONE, 1 on FAILED, 2 when the LLM is unreachable.
int execute_ask(sqlrag::core::Services& services, sqlrag::core::IIdGenerator& id_gen,
                sqlrag::core::IClock& clock, const sqlrag::workflow::WorkflowConfig& config,
                const sqlrag::workflow::WorkflowRequest& request, bool print_trace);
