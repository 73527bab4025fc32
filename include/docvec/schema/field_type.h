#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::schema {

// FieldKind enumerates every type a metadata field can declare.
// The set is closed: adding a kind means updating every switch over it, which the
// compiler flags through -Wswitch.
enum class FieldKind : uint8_t {
  kBool,
  kInt32,
  kInt64,
  kFloat,      // 32-bit float; stored and returned as a JSON number
  kDouble,
  kString,
  kTimestamp,  // ISO-8601 string without zone designator, see timestamp.h
  kList,
  kStruct,
};

// parse_field_kind maps the schema JSON spelling ("int32", "struct", ...) to a FieldKind.
// Case-sensitive. Returns std::nullopt for unrecognised names.
[[nodiscard]] std::optional<FieldKind> parse_field_kind(std::string_view name);

// to_string returns the schema JSON spelling of a FieldKind.
[[nodiscard]] std::string_view to_string(FieldKind kind);

struct MetadataField;

// FieldType is a closed sum of primitive, list and struct types.
// Values are immutable; children are shared between copies.
class FieldType {
 public:
  [[nodiscard]] static FieldType boolean();
  [[nodiscard]] static FieldType int32();
  [[nodiscard]] static FieldType int64();
  [[nodiscard]] static FieldType float32();
  [[nodiscard]] static FieldType float64();
  [[nodiscard]] static FieldType string();
  [[nodiscard]] static FieldType timestamp();
  [[nodiscard]] static FieldType primitive(FieldKind kind);
  [[nodiscard]] static FieldType list(FieldType element);
  [[nodiscard]] static FieldType structure(std::vector<MetadataField> fields);

  [[nodiscard]] FieldKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_primitive() const noexcept;
  [[nodiscard]] bool is_numeric() const noexcept;
  [[nodiscard]] bool is_integer() const noexcept;

  // Element type of a list. Throws std::logic_error for any other kind.
  [[nodiscard]] const FieldType& element() const;

  // Child fields of a struct, in declaration order. Throws std::logic_error for any other kind.
  [[nodiscard]] const std::vector<MetadataField>& fields() const;

  // Returns the named child of a struct, or nullptr.
  [[nodiscard]] const MetadataField* find_field(std::string_view name) const;

  // Human-readable spelling, e.g. "list<struct{a: int32}>". Used in error messages.
  [[nodiscard]] std::string describe() const;

  friend bool operator==(const FieldType& a, const FieldType& b);

 private:
  explicit FieldType(FieldKind kind) : kind_(kind) {}

  FieldKind kind_;
  std::shared_ptr<const FieldType> element_;
  std::shared_ptr<const std::vector<MetadataField>> fields_;
};

struct MetadataField {
  std::string name;
  FieldType type;

  friend bool operator==(const MetadataField& a, const MetadataField& b);
};

}  // namespace docvec::schema
