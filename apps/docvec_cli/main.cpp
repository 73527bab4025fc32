#include "docvec/core/version.h"

#include "commands/search_commands.h"
#include "commands/store_commands.h"

#include <exception>
#include <iostream>
#include <string>

namespace {

struct Command {
  const char* name;
  const char* summary;
  int (*run)(int, char**);
};

constexpr Command kCommands[] = {
    {"init", "Create or open the table described by --config", cmd_init},
    {"write", "Write documents from a JSONL file", cmd_write},
    {"count", "Count documents, optionally filtered", cmd_count},
    {"filter", "Print documents as JSONL, optionally filtered", cmd_filter},
    {"search", "Nearest documents to an embedding", cmd_search},
    {"text-search", "Keyword search over a full-text index", cmd_text_search},
    {"delete", "Delete documents by id", cmd_delete},
    {"index-text", "Build a full-text index on a text field", cmd_index_text},
};

void print_usage() {
  std::cerr << "docvec_cli v" << docvec::core::kBuildVersion << "\n"
            << "Usage: docvec_cli <command> --config <store.json> [options]\n\n"
            << "Commands:\n";
  for (const auto& command : kCommands) {
    std::string name = command.name;
    name.resize(14, ' ');
    std::cerr << "  " << name << command.summary << "\n";
  }
  std::cerr << "\nRun 'docvec_cli <command>' without flags to list its options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  for (const auto& command : kCommands) {
    if (subcommand != command.name) {
      continue;
    }
    try {
      return command.run(argc, argv);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
