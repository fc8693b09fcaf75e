#pragma once

#include <string>

namespace sqlrag::workflow {

// Prompt builders for every LLM call of the pipeline. Each returns the complete
// user-turn text; only the chat handler adds a separate system turn.

extern const char* const kChatSystemPrompt;

[[nodiscard]] std::string intent_classifier_prompt(const std::string& user_input);

[[nodiscard]] std::string schema_selector_prompt(const std::string& tables_info,
                                                 const std::string& user_query);

// rag_examples is the "Similar SQL Examples" block, or "" without augmentation.
[[nodiscard]] std::string text_to_sql_prompt(const std::string& dialect, const std::string& schema,
                                             const std::string& rag_examples,
                                             const std::string& user_query);

[[nodiscard]] std::string sql_to_text_prompt(const std::string& schema, const std::string& sql);

[[nodiscard]] std::string debug_sql_prompt(const std::string& schema, const std::string& sql,
                                           const std::string& error);

}  // namespace sqlrag::workflow
