#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::domain {

using Embedding = std::vector<float>;

// Document is the unit the store reads and writes.
// This is a struct (not class) per C++ Core Guidelines C.2: members vary independently.
//
// - id:        deterministic content hash unless the caller supplies one (see make_document)
// - content:   free text, may be empty
// - meta:      JSON object constrained by the store's MetadataSchema
// - embedding: optional, length must equal the store's embedding dims
// - score:     set only on query results, never persisted
struct Document {
  std::string id;
  std::string content;
  nlohmann::json meta = nlohmann::json::object();
  std::optional<Embedding> embedding;
  std::optional<double> score;
};

// Equality covers id, content, meta and embedding. Score is transient and ignored.
[[nodiscard]] bool operator==(const Document& a, const Document& b);

// compute_document_id hashes content and metadata under the versioned scheme in
// core/version.h. Each piece is length-prefixed so ("ab", {}) and ("a", {"b"...})
// cannot collide by concatenation. Metadata is hashed in its canonical compact JSON
// form (object keys sorted).
[[nodiscard]] std::string compute_document_id(std::string_view content,
                                              const nlohmann::json& meta);

// make_document builds a Document and assigns its deterministic id.
[[nodiscard]] Document make_document(std::string content,
                                     nlohmann::json meta = nlohmann::json::object(),
                                     std::optional<Embedding> embedding = std::nullopt);

}  // namespace docvec::domain
