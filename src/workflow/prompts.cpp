#include "sqlrag/workflow/prompts.h"

namespace sqlrag::workflow {

const char* const kChatSystemPrompt = R"(You are a helpful AI assistant. You can help with:
- General questions and conversations
- Explaining concepts
- Providing information

If the user asks about database queries or SQL, remind them that you can also help with:
- Converting natural language to SQL queries
- Explaining SQL statements
- Debugging SQL errors

Always respond in the same language as the user's input.
)";

std::string intent_classifier_prompt(const std::string& user_input) {
  return R"(You are an intent classification expert. Analyze user input and determine its intent type.

## Intent Types

1. **text_to_sql**: User wants to convert natural language to SQL query
   - Examples: "Query all products with price greater than 100", "Help me count sales by category"

2. **sql_to_text**: User wants to understand the meaning of an SQL statement
   - Examples: "Explain this SQL: SELECT ...", "What does this query mean?"

3. **debug**: User wants to debug or fix problematic SQL
   - Examples: "This SQL has errors, please help", "Why does this query return no results?"

4. **chat**: General conversation, NOT related to database or SQL
   - Examples: "Hello", "What's the weather today?", "Tell me a joke", "Who are you?"
   - Any question that does NOT involve database queries, SQL, or data analysis

## Output Format

Please output in JSON format:
```json
{
    "intent": "text_to_sql|sql_to_text|debug|chat",
    "confidence": 0.0-1.0,
    "reasoning": "Reason for classification"
}
```

## User Input

)" + user_input + "\n";
}

std::string schema_selector_prompt(const std::string& tables_info, const std::string& user_query) {
  return "You are a database expert. Identify the tables relevant to the user query.\n\n"
         "## Available Tables\n\n" +
         tables_info + "\n\n## User Query\n\n" + user_query +
         "\n\n## Task\n\n"
         "Return the names of the tables most relevant to the user query, separated by "
         "commas.\n"
         "Return only table names and nothing else.\n\n"
         "For example: users, orders, products\n";
}

std::string text_to_sql_prompt(const std::string& dialect, const std::string& schema,
                               const std::string& rag_examples, const std::string& user_query) {
  return "You are a professional SQL expert. Generate correct " + dialect +
         " SQL statements based on user requirements and database schema.\n\n"
         "## Database Schema\n\n" +
         schema + "\n\n" + rag_examples + "\n\n## User Request\n\n" + user_query +
         "\n\n## Requirements\n\n"
         "1. Only generate SELECT queries, no INSERT/UPDATE/DELETE\n"
         "2. Use correct table and column names\n"
         "3. Consider JOIN relationships and foreign key constraints\n"
         "4. Add appropriate WHERE conditions and ORDER BY\n"
         "5. Return ONLY the SQL statement, no other explanation\n\n"
         "## SQL Statement\n";
}

std::string sql_to_text_prompt(const std::string& schema, const std::string& sql) {
  return "You are a SQL explanation expert. Explain this SQL statement in simple terms.\n\n"
         "## Database Schema\n\n" +
         schema + "\n\n## SQL Statement\n\n" + sql +
         "\n\n## Explanation Requirements\n\n"
         "1. State the purpose of the query\n"
         "2. Explain the tables and columns involved\n"
         "3. Describe filter conditions and sorting\n"
         "4. Use business language to describe results\n\n"
         "Please respond in the same language as the user's query.\n\n"
         "## Explanation\n";
}

std::string debug_sql_prompt(const std::string& schema, const std::string& sql,
                             const std::string& error) {
  return "You are a SQL debugging expert. Fix the SQL statement based on the error message.\n\n"
         "## Database Schema\n\n" +
         schema + "\n\n## Original SQL\n\n" + sql + "\n\n## Error Message\n\n" + error +
         "\n\n## Fix Requirements\n\n"
         "1. Analyze the error cause\n"
         "2. Fix the SQL statement\n"
         "3. Return ONLY the fixed SQL statement\n\n"
         "## Fixed SQL\n";
}

}  // namespace sqlrag::workflow
