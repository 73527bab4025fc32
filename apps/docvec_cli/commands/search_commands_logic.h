#pragma once

#include "docvec/store/document_store.h"

#include "cli_options.h"

#include <ostream>

namespace docvec::cli {

// Both print one JSON document per line, best match first, through the retriever
// facades so that --top-k falls back to the retriever default.

// Requires config.vector.
int execute_search(store::DocumentStore& store, const CommandConfig& config, std::ostream& out);

// Requires config.query; config.field selects the indexed field (default content).
int execute_text_search(store::DocumentStore& store, const CommandConfig& config,
                        std::ostream& out);

}  // namespace docvec::cli
