#include "docvec/schema/metadata_schema.h"

#include <set>
#include <stdexcept>

namespace docvec::schema {

namespace {

void validate_fields(const std::vector<MetadataField>& fields, const std::string& prefix) {
  std::set<std::string> seen;
  for (const auto& field : fields) {
    const std::string path = prefix.empty() ? field.name : prefix + "." + field.name;
    if (!is_valid_field_name(field.name)) {
      throw std::invalid_argument("invalid metadata field name '" + path +
                                  "' (use [A-Za-z0-9_], not starting with '_')");
    }
    if (!seen.insert(field.name).second) {
      throw std::invalid_argument("duplicate metadata field '" + path + "'");
    }

    // Structs nested in lists are validated too; they share the same naming rules.
    const FieldType* type = &field.type;
    while (type->kind() == FieldKind::kList) {
      type = &type->element();
    }
    if (type->kind() == FieldKind::kStruct) {
      validate_fields(type->fields(), path);
    }
  }
}

std::vector<MetadataField> fields_from_json(const nlohmann::json& array, const char* key) {
  if (!array.is_array()) {
    throw std::invalid_argument(std::string("schema: '") + key + "' must be an array");
  }

  std::vector<MetadataField> fields;
  fields.reserve(array.size());
  for (const auto& entry : array) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
      throw std::invalid_argument("schema: every field needs a string 'name'");
    }
    fields.push_back(MetadataField{entry["name"].get<std::string>(), field_type_from_json(entry)});
  }
  return fields;
}

}  // namespace

MetadataSchema::MetadataSchema(std::vector<MetadataField> fields) : fields_(std::move(fields)) {
  validate_fields(fields_, "");
}

const FieldType* MetadataSchema::find(std::string_view dotted_path) const {
  if (dotted_path.empty()) {
    return nullptr;
  }

  const std::vector<MetadataField>* level = &fields_;
  const FieldType* found = nullptr;
  std::size_t start = 0;
  while (start <= dotted_path.size()) {
    const std::size_t dot = dotted_path.find('.', start);
    const std::string_view segment =
        dotted_path.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                 : dot - start);
    if (level == nullptr) {
      return nullptr;  // path continues below a non-struct field
    }

    found = nullptr;
    for (const auto& field : *level) {
      if (field.name == segment) {
        found = &field.type;
        break;
      }
    }
    if (found == nullptr) {
      return nullptr;
    }

    if (dot == std::string_view::npos) {
      break;
    }
    level = found->kind() == FieldKind::kStruct ? &found->fields() : nullptr;
    start = dot + 1;
  }
  return found;
}

bool is_valid_field_name(std::string_view name) {
  if (name.empty() || name.front() == '_') {
    return false;
  }
  for (const char ch : name) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

nlohmann::json field_type_to_json(const FieldType& type) {
  nlohmann::json j;
  j["type"] = std::string(to_string(type.kind()));
  if (type.kind() == FieldKind::kList) {
    j["element"] = field_type_to_json(type.element());
  } else if (type.kind() == FieldKind::kStruct) {
    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : type.fields()) {
      nlohmann::json child_json = field_type_to_json(child.type);
      child_json["name"] = child.name;
      children.push_back(std::move(child_json));
    }
    j["children"] = std::move(children);
  }
  return j;
}

nlohmann::json schema_to_json(const MetadataSchema& schema) {
  nlohmann::json fields = nlohmann::json::array();
  for (const auto& field : schema.fields()) {
    nlohmann::json field_json = field_type_to_json(field.type);
    field_json["name"] = field.name;
    fields.push_back(std::move(field_json));
  }
  return nlohmann::json{{"fields", std::move(fields)}};
}

FieldType field_type_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    throw std::invalid_argument("schema: field type needs a string 'type'");
  }

  const auto type_name = j["type"].get<std::string>();
  const auto kind = parse_field_kind(type_name);
  if (!kind.has_value()) {
    throw std::invalid_argument("schema: unknown field type '" + type_name + "'");
  }

  switch (kind.value()) {
    case FieldKind::kList:
      if (!j.contains("element")) {
        throw std::invalid_argument("schema: list type needs an 'element'");
      }
      return FieldType::list(field_type_from_json(j["element"]));
    case FieldKind::kStruct:
      if (!j.contains("children")) {
        throw std::invalid_argument("schema: struct type needs 'children'");
      }
      return FieldType::structure(fields_from_json(j["children"], "children"));
    default:
      return FieldType::primitive(kind.value());
  }
}

MetadataSchema schema_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("fields")) {
    throw std::invalid_argument("schema: expected an object with 'fields'");
  }
  return MetadataSchema(fields_from_json(j["fields"], "fields"));
}

}  // namespace docvec::schema
