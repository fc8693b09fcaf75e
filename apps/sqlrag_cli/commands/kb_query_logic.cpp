#include "kb_query_logic.h"

#include "sqlrag/core/errors.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <map>

int execute_kb_status(const sqlrag::retrieval::ExampleStore& store,
                      const sqlrag::vector::VectorIndex& index) {
  std::map<std::string, std::size_t> by_complexity;
  std::size_t learned = 0;
  for (const auto& example : store.list()) {
    ++by_complexity[std::string(sqlrag::domain::to_string(example.complexity))];
    if (example.tags.count("learned") > 0) {
      ++learned;
    }
  }

  nlohmann::json out;
  out["count"] = store.count();
  out["learned"] = learned;
  out["dimension"] = index.dimension();
  out["backend"] = std::string(sqlrag::vector::to_string(index.backend().selected));
  out["embedding"] = store.embedder().provider_id();
  out["complexity"] = by_complexity;
  std::cout << out.dump(2) << "\n";
  return 0;
}

int execute_kb_search(const sqlrag::retrieval::ExampleStore& store,
                      const sqlrag::retrieval::RetrievalQuery& query) {
  std::vector<sqlrag::retrieval::ScoredExample> results;
  try {
    results = store.retrieve(query);
  } catch (const sqlrag::core::EmbeddingError& e) {
    std::cerr << "Error: cannot embed query: " << e.what() << "\n";
    return 1;
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto& r : results) {
    nlohmann::json entry = sqlrag::domain::example_to_json(r.example);
    entry["score"] = r.score;
    entry["adjusted_score"] = r.adjusted_score;
    out.push_back(std::move(entry));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
