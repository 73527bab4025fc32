#pragma once

#include "docvec/schema/metadata_schema.h"
#include "docvec/schema/schema_mapper.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::store {

// ExistsPolicy decides what opening a store does when its table is already present.
// kOpen:      reuse the table when its stored row schema matches, else StoreInitError
// kOverwrite: drop the table and its text indexes, then create it afresh
// kFail:      StoreInitError whenever the table exists
enum class ExistsPolicy : uint8_t {
  kOpen,       // NOLINT(readability-identifier-naming)
  kOverwrite,  // NOLINT(readability-identifier-naming)
  kFail,       // NOLINT(readability-identifier-naming)
};

// DuplicatePolicy decides what write_documents does with an id that is already stored
// or that appears earlier in the same batch.
enum class DuplicatePolicy : uint8_t {
  kFail,       // NOLINT(readability-identifier-naming)
  kSkip,       // NOLINT(readability-identifier-naming)
  kOverwrite,  // NOLINT(readability-identifier-naming)
};

// Spellings: "open" | "overwrite" | "fail" and "fail" | "skip" | "overwrite".
[[nodiscard]] std::optional<ExistsPolicy> parse_exists_policy(std::string_view name);
[[nodiscard]] std::string_view to_string(ExistsPolicy policy);
[[nodiscard]] std::optional<DuplicatePolicy> parse_duplicate_policy(std::string_view name);
[[nodiscard]] std::string_view to_string(DuplicatePolicy policy);

// StoreConfig holds everything needed to open one document table.
// Every field has an explicit default except embedding_dims, which must be set.
struct StoreConfig {
  std::string database_path{":memory:"};       // NOLINT(readability-identifier-naming)
  std::string table_name{"documents"};         // NOLINT(readability-identifier-naming)
  schema::MetadataSchema metadata_schema;      // NOLINT(readability-identifier-naming)
  std::size_t embedding_dims{0};               // NOLINT(readability-identifier-naming)
  ExistsPolicy exists_policy{ExistsPolicy::kOpen};  // NOLINT(readability-identifier-naming)
  schema::UnknownFieldPolicy unknown_field_policy{  // NOLINT(readability-identifier-naming)
                                                  schema::UnknownFieldPolicy::kReject};
  // Fields that get a full-text index when the table is created.
  std::vector<std::string> fts_fields{"content"};  // NOLINT(readability-identifier-naming)
};

// Table names use [A-Za-z0-9_], start with a letter, and stay clear of the reserved
// "_docvec" and "sqlite_" prefixes.
[[nodiscard]] bool is_valid_table_name(std::string_view name);

// Throws std::invalid_argument when the table name is invalid or embedding_dims is zero.
void validate_store_config(const StoreConfig& config);

// JSON form:
//   {"database_path": "./data", "table_name": "documents", "embedding_dims": 768,
//    "metadata_schema": {"fields": [...]}, "exists_policy": "open",
//    "unknown_field_policy": "reject", "fts_fields": ["content"]}
// Only embedding_dims is required. Throws std::invalid_argument on bad input.
[[nodiscard]] StoreConfig store_config_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json store_config_to_json(const StoreConfig& config);

// File helpers. Throw std::runtime_error on I/O failure and std::invalid_argument on
// malformed content.
[[nodiscard]] StoreConfig load_store_config(const std::string& path);
void save_store_config(const std::string& path, const StoreConfig& config);

}  // namespace docvec::store
