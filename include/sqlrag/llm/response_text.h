#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sqlrag::llm {

// Strips a surrounding markdown code fence (```sql ... ```) and trims whitespace.
[[nodiscard]] std::string clean_sql(std::string_view text);

// Finds the first SELECT (ASCII case-insensitive) and returns it up to the next blank
// line or the end of the text, trimmed. nullopt when no SELECT is present.
[[nodiscard]] std::optional<std::string> extract_sql_for_explanation(std::string_view text);

// Returns the body of the first ```json fence, else of the first ``` fence, else the
// trimmed text itself.
[[nodiscard]] std::string extract_json_payload(std::string_view text);

}  // namespace sqlrag::llm
