#include "sqlrag/core/version.h"

#include "commands/ask.h"
#include "commands/kb_init.h"
#include "commands/kb_query.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "sqlrag v" << sqlrag::core::kBuildVersion << "\n"
            << "Usage: sqlrag_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  ask <question...>   Answer a question against --target-db\n"
            << "  kb-init             Build or extend the example knowledge base\n"
            << "  kb-status           Show knowledge base statistics\n"
            << "  kb-search <text...> Retrieve similar examples\n"
            << "  version             Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "ask") {
    return cmd_ask(argc, argv);
  }
  if (subcommand == "kb-init") {
    return cmd_kb_init(argc, argv);
  }
  if (subcommand == "kb-status") {
    return cmd_kb_status(argc, argv);
  }
  if (subcommand == "kb-search") {
    return cmd_kb_search(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << sqlrag::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
