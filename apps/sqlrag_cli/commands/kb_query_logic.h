#pragma once

#include "sqlrag/retrieval/example_store.h"
#include "sqlrag/vector/vector_index.h"

// execute_kb_status: print count, dimension, backend and a complexity histogram.
int execute_kb_status(const sqlrag::retrieval::ExampleStore& store,
                      const sqlrag::vector::VectorIndex& index);

// execute_kb_search: print retrieval results as JSON.
int execute_kb_search(const sqlrag::retrieval::ExampleStore& store,
                      const sqlrag::retrieval::RetrievalQuery& query);
