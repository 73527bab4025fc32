#pragma once

#include "docvec/domain/document.h"

#include <nlohmann/json.hpp>

#include <istream>
#include <string>
#include <vector>

namespace docvec::domain {

// Serialize a Document as {"id", "content", "meta", "embedding", "score"}.
// Absent embedding and score are written as null.
[[nodiscard]] nlohmann::json document_to_json(const Document& doc);

// Deserialize a Document. "content" defaults to "", "meta" to {}; a missing or empty
// "id" is computed with compute_document_id. Throws std::invalid_argument when a key
// has the wrong JSON type.
[[nodiscard]] Document document_from_json(const nlohmann::json& j);

// Compact single-line form, used for JSONL output.
[[nodiscard]] std::string document_to_json_string(const Document& doc);

// Reads one document per line. Blank lines are skipped. Throws std::invalid_argument
// naming the 1-based line number of the first malformed line.
[[nodiscard]] std::vector<Document> read_documents_jsonl(std::istream& in);

}  // namespace docvec::domain
