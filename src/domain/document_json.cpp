#include "docvec/domain/document_json.h"

#include "docvec/core/normalization.h"

#include <stdexcept>

namespace docvec::domain {

nlohmann::json document_to_json(const Document& doc) {
  nlohmann::json j;
  j["id"] = doc.id;
  j["content"] = doc.content;
  j["meta"] = doc.meta;
  j["embedding"] = doc.embedding.has_value() ? nlohmann::json(*doc.embedding) : nlohmann::json();
  j["score"] = doc.score.has_value() ? nlohmann::json(*doc.score) : nlohmann::json();
  return j;
}

Document document_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("document: expected a JSON object");
  }

  Document doc;
  if (j.contains("content") && !j["content"].is_null()) {
    if (!j["content"].is_string()) {
      throw std::invalid_argument("document: 'content' must be a string");
    }
    doc.content = j["content"].get<std::string>();
  }

  if (j.contains("meta") && !j["meta"].is_null()) {
    if (!j["meta"].is_object()) {
      throw std::invalid_argument("document: 'meta' must be an object");
    }
    doc.meta = j["meta"];
  }

  if (j.contains("embedding") && !j["embedding"].is_null()) {
    const auto& embedding = j["embedding"];
    if (!embedding.is_array()) {
      throw std::invalid_argument("document: 'embedding' must be an array of numbers");
    }
    Embedding values;
    values.reserve(embedding.size());
    for (const auto& v : embedding) {
      if (!v.is_number()) {
        throw std::invalid_argument("document: 'embedding' must be an array of numbers");
      }
      values.push_back(v.get<float>());
    }
    doc.embedding = std::move(values);
  }

  if (j.contains("score") && j["score"].is_number()) {
    doc.score = j["score"].get<double>();
  }

  if (j.contains("id") && !j["id"].is_null() && !j["id"].is_string()) {
    throw std::invalid_argument("document: 'id' must be a string");
  }
  if (j.contains("id") && j["id"].is_string() && !j["id"].get<std::string>().empty()) {
    doc.id = j["id"].get<std::string>();
  } else {
    doc.id = compute_document_id(doc.content, doc.meta);
  }

  return doc;
}

std::string document_to_json_string(const Document& doc) {
  return document_to_json(doc).dump();  // Compact JSON
}

std::vector<Document> read_documents_jsonl(std::istream& in) {
  std::vector<Document> documents;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (core::trim(line).empty()) {
      continue;
    }

    auto parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
      throw std::invalid_argument("line " + std::to_string(line_number) + ": not valid JSON");
    }
    try {
      documents.push_back(document_from_json(parsed));
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument("line " + std::to_string(line_number) + ": " + e.what());
    }
  }
  return documents;
}

}  // namespace docvec::domain
