#include "store_commands.h"

#include "docvec/domain/document_json.h"

#include "cli_options.h"
#include "store_commands_logic.h"

#include <fstream>
#include <iostream>
#include <vector>

using docvec::cli::CommandOption;

int cmd_init(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {docvec::cli::config_option(),
                                              docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "init", options);
  if (!config.has_value()) {
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_init(store, std::cout);
}

int cmd_write(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {
      docvec::cli::config_option(), docvec::cli::input_option(), docvec::cli::policy_option(),
      docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "write", options);
  if (!config.has_value()) {
    return 1;
  }
  if (!config->input_path.has_value()) {
    std::cerr << "Error: --input <docs.jsonl> is required\n";
    return 1;
  }

  std::vector<docvec::domain::Document> documents;
  if (config->input_path.value() == "-") {
    documents = docvec::domain::read_documents_jsonl(std::cin);
  } else {
    std::ifstream input(config->input_path.value());
    if (!input.is_open()) {
      std::cerr << "Error: cannot open " << config->input_path.value() << "\n";
      return 1;
    }
    documents = docvec::domain::read_documents_jsonl(input);
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_write(store, documents, *config, std::cout);
}

int cmd_count(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {docvec::cli::config_option(),
                                              docvec::cli::filter_option(),
                                              docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "count", options);
  if (!config.has_value()) {
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_count(store, *config, std::cout);
}

int cmd_filter(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {docvec::cli::config_option(),
                                              docvec::cli::filter_option(),
                                              docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "filter", options);
  if (!config.has_value()) {
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_filter(store, *config, std::cout);
}

int cmd_delete(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {docvec::cli::config_option(),
                                              docvec::cli::id_option(),
                                              docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "delete", options);
  if (!config.has_value()) {
    return 1;
  }
  if (config->ids.empty()) {
    std::cerr << "Error: at least one --id <id> is required\n";
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_delete(store, *config, std::cout);
}

int cmd_index_text(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<CommandOption> options = {
      docvec::cli::config_option(),
      docvec::cli::field_option("Field to index: content or a string metadata field"),
      docvec::cli::replace_option(), docvec::cli::log_level_option()};
  auto config = docvec::cli::parse_command(argc, argv, "index-text", options);
  if (!config.has_value()) {
    return 1;
  }
  if (!config->field.has_value()) {
    std::cerr << "Error: --field <field> is required\n";
    return 1;
  }

  auto store = docvec::cli::open_store(*config);
  return docvec::cli::execute_index_text(store, *config, std::cout);
}
