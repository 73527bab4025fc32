#include "docvec/domain/document.h"

#include "docvec/core/sha256.h"
#include "docvec/core/version.h"

namespace docvec::domain {

namespace {

void update_framed(core::Sha256& hasher, std::string_view piece) {
  const std::string length = std::to_string(piece.size()) + ":";
  hasher.update(length);
  hasher.update(piece);
}

}  // namespace

bool operator==(const Document& a, const Document& b) {
  return a.id == b.id && a.content == b.content && a.meta == b.meta &&
         a.embedding == b.embedding;
}

std::string compute_document_id(std::string_view content, const nlohmann::json& meta) {
  core::Sha256 hasher;
  update_framed(hasher, core::kDocumentIdScheme);
  update_framed(hasher, content);
  update_framed(hasher, meta.dump());
  return hasher.hex_digest();
}

Document make_document(std::string content, nlohmann::json meta,
                       std::optional<Embedding> embedding) {
  Document doc;
  doc.id = compute_document_id(content, meta);
  doc.content = std::move(content);
  doc.meta = std::move(meta);
  doc.embedding = std::move(embedding);
  return doc;
}

}  // namespace docvec::domain
