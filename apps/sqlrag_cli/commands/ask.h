#pragma once

// cmd_ask: answer one natural-language request against a SQLite database.
// Usage: sqlrag_cli ask <question...> --target-db <path> [--kb <dir>] [--max-retries N]
//                   [--timeout-ms N] [--k N] [--audit-db <path>] [--trace] [--no-feedback]
//                   [model flags]
// Exit codes: 0 answered, 1 request failed or bad arguments, 2 LLM unreachable.
int cmd_ask(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
