#pragma once

// cmd_kb_init: build or extend a knowledge base from example sources.
// Usage: sqlrag_cli kb-init --kb <dir> [--examples <file-or-dir>]... [--no-base]
//                           [--generate N --target-db <path>] [--generated-file <path>]
//                           [model flags]
int cmd_kb_init(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
