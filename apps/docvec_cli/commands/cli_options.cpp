#include "cli_options.h"

#include "docvec/domain/document_json.h"
#include "docvec/observability/logging.h"

#include "cli_options_logic.h"

#include <iostream>

namespace docvec::cli {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

CommandOption config_option() {
  return {"--config", true, "Store config JSON file (required)",
          [](CommandConfig& c, const std::string& v) {
            c.config_path = v;
            return true;
          }};
}

CommandOption input_option() {
  return {"--input", true, "JSONL file with one document per line ('-' for stdin)",
          [](CommandConfig& c, const std::string& v) {
            c.input_path = v;
            return true;
          }};
}

CommandOption policy_option() {
  return {"--policy", true, "Duplicate policy (fail|skip|overwrite)",
          [](CommandConfig& c, const std::string& v) {
            auto policy = store::parse_duplicate_policy(v);
            if (!policy.has_value()) {
              std::cerr << "Invalid --policy: " << v << " (valid: fail, skip, overwrite)\n";
              return false;
            }
            c.policy = policy.value();
            return true;
          }};
}

CommandOption filter_option() {
  return {"--filter", true, "Filter as JSON ({\"field\",\"operator\",\"value\"})",
          [](CommandConfig& c, const std::string& v) {
            auto decoded = decode_filter(v);
            if (!decoded.has_value()) {
              std::cerr << "Invalid --filter: " << decoded.error() << "\n";
              return false;
            }
            c.filters = decoded.value();
            return true;
          }};
}

CommandOption vector_option() {
  return {"--vector", true, "Query embedding as a JSON array of numbers",
          [](CommandConfig& c, const std::string& v) {
            auto decoded = decode_vector(v);
            if (!decoded.has_value()) {
              std::cerr << "Invalid --vector: " << decoded.error() << "\n";
              return false;
            }
            c.vector = decoded.value();
            return true;
          }};
}

CommandOption top_k_option() {
  return {"--top-k", true, "Number of results (default 10)",
          [](CommandConfig& c, const std::string& v) {
            auto decoded = decode_top_k(v);
            if (!decoded.has_value()) {
              std::cerr << "Invalid --top-k: " << decoded.error() << "\n";
              return false;
            }
            c.top_k = decoded.value();
            return true;
          }};
}

CommandOption metric_option() {
  return {"--metric", true, "Distance metric (l2|cosine|dot)",
          [](CommandConfig& c, const std::string& v) {
            auto metric = search::parse_distance_metric(v);
            if (!metric.has_value()) {
              std::cerr << "Invalid --metric: " << v << " (valid: l2, cosine, dot)\n";
              return false;
            }
            c.metric = metric.value();
            return true;
          }};
}

CommandOption query_option() {
  return {"--query", true, "Keyword query",
          [](CommandConfig& c, const std::string& v) {
            c.query = v;
            return true;
          }};
}

CommandOption field_option(const char* description) {
  return {"--field", true, description,
          [](CommandConfig& c, const std::string& v) {
            c.field = v;
            return true;
          }};
}

CommandOption id_option() {
  return {"--id", true, "Document id (repeatable)",
          [](CommandConfig& c, const std::string& v) {
            c.ids.push_back(v);
            return true;
          }};
}

CommandOption replace_option() {
  return {"--replace", false, "Rebuild the index if it already exists",
          [](CommandConfig& c, const std::string& /*v*/) {
            c.replace = true;
            return true;
          }};
}

CommandOption log_level_option() {
  return {"--log-level", true, "trace|debug|info|warn|error|critical|off",
          [](CommandConfig& c, const std::string& v) {
            if (!observability::parse_log_level(v).has_value()) {
              std::cerr << "Invalid --log-level: " << v << "\n";
              return false;
            }
            c.log_level = v;
            return true;
          }};
}

// ────────────────────────────────────────────────────────────────
// Command plumbing
// ────────────────────────────────────────────────────────────────

std::optional<CommandConfig> parse_command(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                           std::string_view command,
                                           const std::vector<CommandOption>& options) {
  auto outcome = apps::parse_options(argc, argv, options);
  if (outcome.ok && !outcome.config.config_path.has_value()) {
    std::cerr << "Error: --config <store.json> is required\n";
    outcome.ok = false;
  }
  if (!outcome.ok) {
    std::cerr << "Usage: docvec_cli " << command << " [options]\n";
    apps::print_options(std::cerr, options);
    return std::nullopt;
  }

  observability::init_logging(outcome.config.log_level);
  return std::move(outcome.config);
}

store::DocumentStore open_store(const CommandConfig& config) {
  auto store_config = store::load_store_config(config.config_path.value());
  DOCVEC_LOG_DEBUG("opening store", {{"config", config.config_path.value()},
                                     {"database", store_config.database_path},
                                     {"table", store_config.table_name}});
  return store::DocumentStore::create(std::move(store_config));
}

void print_documents(std::ostream& out, const std::vector<domain::Document>& documents) {
  for (const auto& doc : documents) {
    out << domain::document_to_json_string(doc) << "\n";
  }
}

}  // namespace docvec::cli
