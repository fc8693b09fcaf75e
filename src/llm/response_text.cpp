#include "sqlrag/llm/response_text.h"

#include "sqlrag/core/normalization.h"

namespace sqlrag::llm {

std::string clean_sql(const std::string_view text) {
  std::string sql = core::trim(text);
  if (sql.rfind("```", 0) != 0) {
    return sql;
  }

  // Drop the opening fence line (it may carry a language tag).
  const std::size_t first_newline = sql.find('\n');
  if (first_newline == std::string::npos) {
    return "";
  }
  sql = sql.substr(first_newline + 1);

  // Drop a closing fence line.
  std::string trimmed = core::trim(sql);
  if (trimmed.size() >= 3 && trimmed.compare(trimmed.size() - 3, 3, "```") == 0) {
    trimmed.erase(trimmed.size() - 3);
  }
  return core::trim(trimmed);
}

std::optional<std::string> extract_sql_for_explanation(const std::string_view text) {
  const std::string upper = core::normalize_ascii_upper(text);
  const std::size_t start = upper.find("SELECT");
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const std::size_t end = upper.find("\n\n", start);
  const std::string_view sql =
      text.substr(start, end == std::string::npos ? std::string_view::npos : end - start);
  return core::trim(sql);
}

std::string extract_json_payload(const std::string_view text) {
  for (const std::string_view fence : {std::string_view("```json"), std::string_view("```")}) {
    const std::size_t open = text.find(fence);
    if (open == std::string_view::npos) {
      continue;
    }
    const std::size_t body = open + fence.size();
    const std::size_t close = text.find("```", body);
    return core::trim(text.substr(body, close == std::string_view::npos ? std::string_view::npos
                                                                          : close - body));
  }
  return core::trim(text);
}

}  // namespace sqlrag::llm
