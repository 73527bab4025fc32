#include "search_commands.h"

#include "cli_options.h"
#include "search_commands_logic.h"

#include <iostream>
#include <vector>

using docvec::cli::CommandOption;

int cmd_search(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {
      docvec::cli::config_option(), docvec::cli::vector_option(), docvec::cli::top_k_option(),
      docvec::cli::metric_option(), docvec::cli::filter_option(),
      docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "search", options);
  if (!config.has_value()) {
    return 1;
  }
  if (!config->vector.has_value()) {
    std::cerr << "Error: --vector <json array> is required\n";
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_search(store, *config, std::cout);
}

int cmd_text_search(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {
      docvec::cli::config_option(), docvec::cli::query_option(),
      docvec::cli::field_option("Indexed text field (default content)"),
      docvec::cli::top_k_option(), docvec::cli::filter_option(), docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "text-search", options);
  if (!config.has_value()) {
    return 1;
  }
  if (!config->query.has_value()) {
    std::cerr << "Error: --query <text> is required\n";
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_text_search(store, *config, std::cout);
}
