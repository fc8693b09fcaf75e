#include "sqlrag/ingest/example_generator.h"

#include "sqlrag/core/errors.h"
#include "sqlrag/ingest/example_loader.h"
#include "sqlrag/llm/response_text.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace sqlrag::ingest {

std::string example_generation_prompt(const std::string& schema_text, const std::size_t count) {
  const std::string n = std::to_string(count);
  return "You are a SQL expert. Based on the following database schema, generate diverse SQL "
         "query examples.\n\n"
         "## Database Schema\n\n" +
         schema_text +
         "\n\n## Requirements\n\n"
         "Generate " +
         n +
         " SQL query examples covering:\n"
         "1. Basic queries (SELECT, WHERE, ORDER BY, LIMIT)\n"
         "2. Aggregation (COUNT, SUM, AVG, MAX, MIN, GROUP BY, HAVING)\n"
         "3. JOIN operations (INNER, LEFT, RIGHT)\n"
         "4. Subqueries (IN, EXISTS)\n"
         "5. Complex combinations\n\n"
         "For each example, provide:\n"
         "- natural_query: Natural language description (in Chinese)\n"
         "- sql: The SQL query\n"
         "- tables: List of tables used\n"
         "- complexity: simple/medium/complex\n"
         "- tags: List of operation tags\n\n"
         "## Output Format\n\n"
         "Return a JSON array:\n"
         "```json\n"
         "[\n"
         "  {\n"
         "    \"natural_query\": \"查询所有价格大于100的商品\",\n"
         "    \"sql\": \"SELECT * FROM products WHERE price > 100\",\n"
         "    \"tables\": [\"products\"],\n"
         "    \"complexity\": \"simple\",\n"
         "    \"tags\": [\"select\", \"where\", \"comparison\"]\n"
         "  }\n"
         "]\n"
         "```\n\n"
         "Generate " +
         n + " diverse examples now:\n";
}

core::Result<std::vector<domain::Example>, core::ParseError> parse_generated_examples(
    const std::string_view text) {
  using ParseResult = core::Result<std::vector<domain::Example>, core::ParseError>;

  const auto parsed = nlohmann::json::parse(llm::extract_json_payload(text), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }

  std::vector<domain::Example> examples;
  for (const auto& entry : parsed) {
    auto example = domain::example_from_json(entry);
    if (example.has_value() && is_loadable_example(example.value())) {
      domain::Example e = std::move(example.value());
      e.id.clear();
      examples.push_back(std::move(e));
    }
  }
  return ParseResult::ok(std::move(examples));
}

std::vector<domain::Example> ExampleGenerator::generate(const std::string& schema_text,
                                                        const std::size_t count) {
  if (count == 0) {
    return {};
  }

  std::string answer;
  try {
    answer = llm_.complete(
        {{domain::ChatRole::kUser, example_generation_prompt(schema_text, count)}});
  } catch (const core::LlmResponseError& e) {
    std::cerr << "Error generating SQL examples: " << e.what() << "\n";
    return {};
  }

  auto parsed = parse_generated_examples(answer);
  if (!parsed.has_value()) {
    std::cerr << "Error generating SQL examples: answer is not a JSON array\n";
    return {};
  }
  return parsed.value();
}

}  // namespace sqlrag::ingest
