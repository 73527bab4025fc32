#include "docvec/schema/field_type.h"

#include <stdexcept>

namespace docvec::schema {

std::optional<FieldKind> parse_field_kind(std::string_view name) {
  if (name == "bool") {
    return FieldKind::kBool;
  }
  if (name == "int32") {
    return FieldKind::kInt32;
  }
  if (name == "int64") {
    return FieldKind::kInt64;
  }
  if (name == "float") {
    return FieldKind::kFloat;
  }
  if (name == "double") {
    return FieldKind::kDouble;
  }
  if (name == "string") {
    return FieldKind::kString;
  }
  if (name == "timestamp") {
    return FieldKind::kTimestamp;
  }
  if (name == "list") {
    return FieldKind::kList;
  }
  if (name == "struct") {
    return FieldKind::kStruct;
  }
  return std::nullopt;
}

std::string_view to_string(FieldKind kind) {
  switch (kind) {
    case FieldKind::kBool:
      return "bool";
    case FieldKind::kInt32:
      return "int32";
    case FieldKind::kInt64:
      return "int64";
    case FieldKind::kFloat:
      return "float";
    case FieldKind::kDouble:
      return "double";
    case FieldKind::kString:
      return "string";
    case FieldKind::kTimestamp:
      return "timestamp";
    case FieldKind::kList:
      return "list";
    case FieldKind::kStruct:
      return "struct";
  }
  return "unknown";  // unreachable
}

FieldType FieldType::boolean() { return FieldType(FieldKind::kBool); }
FieldType FieldType::int32() { return FieldType(FieldKind::kInt32); }
FieldType FieldType::int64() { return FieldType(FieldKind::kInt64); }
FieldType FieldType::float32() { return FieldType(FieldKind::kFloat); }
FieldType FieldType::float64() { return FieldType(FieldKind::kDouble); }
FieldType FieldType::string() { return FieldType(FieldKind::kString); }
FieldType FieldType::timestamp() { return FieldType(FieldKind::kTimestamp); }

FieldType FieldType::primitive(FieldKind kind) {
  if (kind == FieldKind::kList || kind == FieldKind::kStruct) {
    throw std::invalid_argument("FieldType::primitive: '" + std::string(to_string(kind)) +
                                "' is not a primitive kind");
  }
  return FieldType(kind);
}

FieldType FieldType::list(FieldType element) {
  FieldType type(FieldKind::kList);
  type.element_ = std::make_shared<const FieldType>(std::move(element));
  return type;
}

FieldType FieldType::structure(std::vector<MetadataField> fields) {
  FieldType type(FieldKind::kStruct);
  type.fields_ = std::make_shared<const std::vector<MetadataField>>(std::move(fields));
  return type;
}

bool FieldType::is_primitive() const noexcept {
  return kind_ != FieldKind::kList && kind_ != FieldKind::kStruct;
}

bool FieldType::is_numeric() const noexcept {
  return is_integer() || kind_ == FieldKind::kFloat || kind_ == FieldKind::kDouble;
}

bool FieldType::is_integer() const noexcept {
  return kind_ == FieldKind::kInt32 || kind_ == FieldKind::kInt64;
}

const FieldType& FieldType::element() const {
  if (kind_ != FieldKind::kList) {
    throw std::logic_error("FieldType::element called on " + describe());
  }
  return *element_;
}

const std::vector<MetadataField>& FieldType::fields() const {
  if (kind_ != FieldKind::kStruct) {
    throw std::logic_error("FieldType::fields called on " + describe());
  }
  return *fields_;
}

const MetadataField* FieldType::find_field(std::string_view name) const {
  if (kind_ != FieldKind::kStruct) {
    return nullptr;
  }
  for (const auto& field : *fields_) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

std::string FieldType::describe() const {
  switch (kind_) {
    case FieldKind::kList:
      return "list<" + element_->describe() + ">";
    case FieldKind::kStruct: {
      std::string out = "struct{";
      for (std::size_t i = 0; i < fields_->size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += (*fields_)[i].name + ": " + (*fields_)[i].type.describe();
      }
      return out + "}";
    }
    default:
      return std::string(to_string(kind_));
  }
}

bool operator==(const FieldType& a, const FieldType& b) {
  if (a.kind_ != b.kind_) {
    return false;
  }
  if (a.kind_ == FieldKind::kList) {
    return *a.element_ == *b.element_;
  }
  if (a.kind_ == FieldKind::kStruct) {
    return *a.fields_ == *b.fields_;
  }
  return true;
}

bool operator==(const MetadataField& a, const MetadataField& b) {
  return a.name == b.name && a.type == b.type;
}

}  // namespace docvec::schema
