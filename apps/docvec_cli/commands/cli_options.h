#pragma once

#include "docvec/domain/document.h"
#include "docvec/filter/filter_expr.h"
#include "docvec/search/distance.h"
#include "docvec/store/document_store.h"
#include "docvec/store/store_config.h"

#include "shared/arg_parser.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::cli {

// CommandConfig holds every flag any subcommand accepts; each subcommand registers
// only the options it understands.
struct CommandConfig {
  std::optional<std::string> config_path;                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> input_path;                       // NOLINT(readability-identifier-naming)
  store::DuplicatePolicy policy{store::DuplicatePolicy::kFail};  // NOLINT(readability-identifier-naming)
  std::optional<filter::FilterExpr> filters;                   // NOLINT(readability-identifier-naming)
  std::optional<domain::Embedding> vector;                     // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> top_k;                            // NOLINT(readability-identifier-naming)
  search::DistanceMetric metric{search::DistanceMetric::kL2};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> query;                            // NOLINT(readability-identifier-naming)
  std::optional<std::string> field;                            // NOLINT(readability-identifier-naming)
  std::vector<std::string> ids;                                // NOLINT(readability-identifier-naming)
  bool replace{false};                                         // NOLINT(readability-identifier-naming)
  std::optional<std::string> log_level;                        // NOLINT(readability-identifier-naming)
};

using CommandOption = apps::Option<CommandConfig>;

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

[[nodiscard]] CommandOption config_option();
[[nodiscard]] CommandOption input_option();
[[nodiscard]] CommandOption policy_option();
[[nodiscard]] CommandOption filter_option();
[[nodiscard]] CommandOption vector_option();
[[nodiscard]] CommandOption top_k_option();
[[nodiscard]] CommandOption metric_option();
[[nodiscard]] CommandOption query_option();
[[nodiscard]] CommandOption field_option(const char* description);
[[nodiscard]] CommandOption id_option();
[[nodiscard]] CommandOption replace_option();
[[nodiscard]] CommandOption log_level_option();

// parse_command parses the flags after the subcommand name, requires --config and
// initialises logging. Returns std::nullopt after printing diagnostics and usage.
[[nodiscard]] std::optional<CommandConfig> parse_command(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    std::string_view command, const std::vector<CommandOption>& options);

// Opens the store described by the --config file.
[[nodiscard]] store::DocumentStore open_store(const CommandConfig& config);

// One compact JSON document per line.
void print_documents(std::ostream& out, const std::vector<domain::Document>& documents);

}  // namespace docvec::cli
