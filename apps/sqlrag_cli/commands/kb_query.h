#pragma once

// cmd_kb_status: print the size and configuration of a knowledge base.
// Usage: sqlrag_cli kb-status --kb <dir> [model flags]
int cmd_kb_status(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_kb_search: retrieve examples similar to a query.
// Usage: sqlrag_cli kb-search <text...> --kb <dir> [--tables a,b] [--k N]
//                             [--complexity simple|medium|complex] [model flags]
int cmd_kb_search(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
