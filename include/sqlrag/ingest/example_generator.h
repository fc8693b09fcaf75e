#pragma once

#include "sqlrag/core/result.h"
#include "sqlrag/domain/example.h"
#include "sqlrag/llm/llm_client.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrag::ingest {

[[nodiscard]] std::string example_generation_prompt(const std::string& schema_text,
                                                    std::size_t count);

// Parses the generator's answer: a JSON array (optionally fenced) of example objects.
// Entries that are not loadable examples are dropped. A payload that is not a JSON
// array is kInvalidFormat.
[[nodiscard]] core::Result<std::vector<domain::Example>, core::ParseError>
parse_generated_examples(std::string_view text);

// ExampleGenerator asks the LLM for new examples over a rendered schema.
class ExampleGenerator {
 public:
  explicit ExampleGenerator(llm::ILlmClient& llm) : llm_(llm) {}

  // Returns the valid examples, or an empty list when the answer cannot be parsed or
  // the model responded with an error. core::LlmUnavailableError propagates.
  [[nodiscard]] std::vector<domain::Example> generate(const std::string& schema_text,
                                                      std::size_t count);

 private:
  llm::ILlmClient& llm_;
};

}  // namespace sqlrag::ingest
