#include "search_commands_logic.h"

#include "docvec/retrieval/embedding_retriever.h"
#include "docvec/retrieval/fts_retriever.h"

#include <utility>

namespace docvec::cli {

int execute_search(store::DocumentStore& store, const CommandConfig& config, std::ostream& out) {
  retrieval::EmbeddingRetriever retriever(
      store, retrieval::EmbeddingRetrieverConfig{.filters = config.filters,
                                                 .metric = config.metric});
  print_documents(out, retriever.retrieve(config.vector.value(), config.top_k));
  return 0;
}

int execute_text_search(store::DocumentStore& store, const CommandConfig& config,
                        std::ostream& out) {
  retrieval::FtsRetrieverConfig retriever_config{.filters = config.filters};
  if (config.field.has_value()) {
    retriever_config.text_field = config.field.value();
  }
  retrieval::FtsRetriever retriever(store, std::move(retriever_config));
  print_documents(out, retriever.retrieve(config.query.value(), config.top_k));
  return 0;
}

}  // namespace docvec::cli
