#include "sqlrag/execution/sql_executor.h"

#include <catch2/catch_test_macros.hpp>

using namespace sqlrag;

namespace {

domain::ExecutionResult make_result(std::size_t rows) {
  domain::ExecutionResult result;
  result.columns = {"id", "name"};
  for (std::size_t i = 0; i < rows; ++i) {
    result.rows.push_back({std::to_string(i + 1), "item" + std::to_string(i + 1)});
  }
  result.row_count = rows;
  return result;
}

}  // namespace

TEST_CASE("format_result_table renders a markdown table", "[execution][format]") {
  auto result = make_result(2);
  result.rows[1][1] = std::nullopt;

  CHECK(execution::format_result_table(result) ==
        "| id | name |\n"
        "|---|---|\n"
        "| 1 | item1 |\n"
        "| 2 | NULL |");
}

TEST_CASE("format_result_table limits displayed rows", "[execution][format]") {
  const auto text = execution::format_result_table(make_result(12), 10);
  CHECK(text.find("| 10 | item10 |") != std::string::npos);
  CHECK(text.find("| 11 | item11 |") == std::string::npos);
  CHECK(text.find("\n\n... and 2 more rows") != std::string::npos);
}

TEST_CASE("format_result_table counts rows beyond the executor cap", "[execution][format]") {
  auto result = make_result(3);
  result.row_count = 250;
  result.truncated = true;
  CHECK(execution::format_result_table(result, 10).find("... and 247 more rows") !=
        std::string::npos);
}

TEST_CASE("format_result_table truncates long cells", "[execution][format]") {
  auto result = make_result(1);
  result.rows[0][1] = std::string(60, 'x');
  const auto text = execution::format_result_table(result);
  CHECK(text.find(std::string(47, 'x') + "...") != std::string::npos);
  CHECK(text.find(std::string(48, 'x')) == std::string::npos);
}

TEST_CASE("format_result_table on an empty result", "[execution][format]") {
  CHECK(execution::format_result_table(make_result(0)) == "No data returned.");
}

TEST_CASE("format_query_response shows SQL, count and table", "[execution][format]") {
  const auto text = execution::format_query_response("SELECT id, name FROM t", make_result(1));
  CHECK(text.rfind("**Generated SQL:**\n```sql\nSELECT id, name FROM t\n```\n", 0) == 0);
  CHECK(text.find("**Query Result:** 1 rows returned\n\n| id | name |") != std::string::npos);
}
