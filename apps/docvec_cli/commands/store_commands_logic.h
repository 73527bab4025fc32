#pragma once

#include "docvec/domain/document.h"
#include "docvec/store/document_store.h"

#include "cli_options.h"

#include <ostream>
#include <vector>

// Table maintenance against an already opened store. Each prints its result to out
// and returns the process exit code; store errors propagate as exceptions.
namespace docvec::cli {

// Prints {"table","documents","embedding_dims","fts_fields"}.
int execute_init(store::DocumentStore& store, std::ostream& out);

// Writes documents under config.policy and prints {"read","written","policy"}.
int execute_write(store::DocumentStore& store, const std::vector<domain::Document>& documents,
                  const CommandConfig& config, std::ostream& out);

int execute_count(store::DocumentStore& store, const CommandConfig& config, std::ostream& out);
int execute_filter(store::DocumentStore& store, const CommandConfig& config, std::ostream& out);

// Prints {"requested","deleted"}.
int execute_delete(store::DocumentStore& store, const CommandConfig& config, std::ostream& out);

// Requires config.field; prints {"fts_fields"} after the build.
int execute_index_text(store::DocumentStore& store, const CommandConfig& config,
                       std::ostream& out);

}  // namespace docvec::cli
