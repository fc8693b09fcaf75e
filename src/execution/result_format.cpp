#include "sqlrag/execution/sql_executor.h"

#include "sqlrag/core/normalization.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <vector>

namespace sqlrag::execution {

namespace {

constexpr std::size_t kMaxCellWidth = 50;
constexpr std::size_t kCellCut = 47;

std::string render_cell(const std::optional<std::string>& cell) {
  if (!cell.has_value()) {
    return "NULL";
  }
  if (cell->size() > kMaxCellWidth) {
    return cell->substr(0, kCellCut) + "...";
  }
  return *cell;
}

}  // namespace

std::string format_result_table(const domain::ExecutionResult& result,
                                const std::size_t max_display) {
  if (result.rows.empty() || result.columns.empty()) {
    return "No data returned.";
  }

  std::ostringstream out;
  out << "| " << core::join(result.columns, " | ") << " |\n";
  out << "|";
  for (std::size_t c = 0; c < result.columns.size(); ++c) {
    out << (c == 0 ? "---" : "|---");
  }
  out << "|";

  const std::size_t shown = std::min(max_display, result.rows.size());
  for (std::size_t r = 0; r < shown; ++r) {
    std::vector<std::string> cells;
    cells.reserve(result.columns.size());
    for (std::size_t c = 0; c < result.columns.size(); ++c) {
      cells.push_back(c < result.rows[r].size() ? render_cell(result.rows[r][c]) : "");
    }
    out << "\n| " << core::join(cells, " | ") << " |";
  }

  if (result.row_count > shown) {
    out << "\n\n... and " << (result.row_count - shown) << " more rows";
  }
  return out.str();
}

std::string format_query_response(const std::string& sql, const domain::ExecutionResult& result,
                                  const std::size_t max_display) {
  std::ostringstream out;
  out << "**Generated SQL:**\n```sql\n" << sql << "\n```\n";
  out << "\n**Query Result:** " << result.row_count << " rows returned\n\n";
  out << format_result_table(result, max_display);
  return out.str();
}

}  // namespace sqlrag::execution
