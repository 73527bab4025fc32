#include "store_commands_logic.h"

#include <nlohmann/json.hpp>

namespace docvec::cli {

int execute_init(store::DocumentStore& store, std::ostream& out) {
  nlohmann::json summary;
  summary["table"] = store.config().table_name;
  summary["documents"] = store.count_documents();
  summary["embedding_dims"] = store.row_schema().embedding_dims();
  summary["fts_fields"] = store.fts_fields();
  out << summary.dump() << "\n";
  return 0;
}

int execute_write(store::DocumentStore& store, const std::vector<domain::Document>& documents,
                  const CommandConfig& config, std::ostream& out) {
  const auto written = store.write_documents(documents, config.policy);

  nlohmann::json summary;
  summary["read"] = documents.size();
  summary["written"] = written;
  summary["policy"] = std::string(store::to_string(config.policy));
  out << summary.dump() << "\n";
  return 0;
}

int execute_count(store::DocumentStore& store, const CommandConfig& config, std::ostream& out) {
  out << store.count_documents(config.filters) << "\n";
  return 0;
}

int execute_filter(store::DocumentStore& store, const CommandConfig& config, std::ostream& out) {
  print_documents(out, store.filter_documents(config.filters));
  return 0;
}

int execute_delete(store::DocumentStore& store, const CommandConfig& config, std::ostream& out) {
  nlohmann::json summary;
  summary["requested"] = config.ids.size();
  summary["deleted"] = store.delete_documents(config.ids);
  out << summary.dump() << "\n";
  return 0;
}

int execute_index_text(store::DocumentStore& store, const CommandConfig& config,
                       std::ostream& out) {
  store.create_fts_index(config.field.value(), config.replace);

  nlohmann::json summary;
  summary["fts_fields"] = store.fts_fields();
  out << summary.dump() << "\n";
  return 0;
}

}  // namespace docvec::cli
