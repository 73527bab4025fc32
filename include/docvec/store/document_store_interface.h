#pragma once

#include "docvec/domain/document.h"
#include "docvec/filter/filter_expr.h"
#include "docvec/store/store_config.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docvec::store {

// IDocumentStore is the document-store protocol retrieval pipelines program against:
// count, filter, write and delete. Filters are structured FilterExpr trees; an empty
// optional means "every document".
class IDocumentStore {
 public:
  virtual ~IDocumentStore() = default;

  [[nodiscard]] virtual std::size_t count_documents(
      const std::optional<filter::FilterExpr>& filters) const = 0;

  [[nodiscard]] virtual std::vector<domain::Document> filter_documents(
      const std::optional<filter::FilterExpr>& filters) const = 0;

  // Returns the number of documents written (see DuplicatePolicy).
  virtual std::size_t write_documents(const std::vector<domain::Document>& documents,
                                      DuplicatePolicy policy) = 0;

  // Returns the number of documents removed; unknown ids are ignored.
  virtual std::size_t delete_documents(const std::vector<std::string>& document_ids) = 0;
};

}  // namespace docvec::store
