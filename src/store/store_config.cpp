#include "docvec/store/store_config.h"

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace docvec::store {

namespace {

std::string string_option(const nlohmann::json& j, const char* key, std::string fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  if (!j[key].is_string()) {
    throw std::invalid_argument(std::string("store config: '") + key + "' must be a string");
  }
  return j[key].get<std::string>();
}

}  // namespace

std::optional<ExistsPolicy> parse_exists_policy(std::string_view name) {
  if (name == "open") {
    return ExistsPolicy::kOpen;
  }
  if (name == "overwrite") {
    return ExistsPolicy::kOverwrite;
  }
  if (name == "fail") {
    return ExistsPolicy::kFail;
  }
  return std::nullopt;
}

std::string_view to_string(ExistsPolicy policy) {
  switch (policy) {
    case ExistsPolicy::kOpen:
      return "open";
    case ExistsPolicy::kOverwrite:
      return "overwrite";
    case ExistsPolicy::kFail:
      return "fail";
  }
  return "open";  // unreachable
}

std::optional<DuplicatePolicy> parse_duplicate_policy(std::string_view name) {
  if (name == "fail") {
    return DuplicatePolicy::kFail;
  }
  if (name == "skip") {
    return DuplicatePolicy::kSkip;
  }
  if (name == "overwrite") {
    return DuplicatePolicy::kOverwrite;
  }
  return std::nullopt;
}

std::string_view to_string(DuplicatePolicy policy) {
  switch (policy) {
    case DuplicatePolicy::kFail:
      return "fail";
    case DuplicatePolicy::kSkip:
      return "skip";
    case DuplicatePolicy::kOverwrite:
      return "overwrite";
  }
  return "fail";  // unreachable
}

bool is_valid_table_name(std::string_view name) {
  if (name.empty() || name.size() > 128) {
    return false;
  }
  const char first = name.front();
  if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z'))) {
    return false;
  }
  for (const char ch : name) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '_';
    if (!ok) {
      return false;
    }
  }
  // FTS tables are named "<table>__fts__<field>"; a table name containing the marker
  // could collide with another table's index.
  return name.find("__fts__") == std::string_view::npos && name.rfind("sqlite_", 0) != 0;
}

void validate_store_config(const StoreConfig& config) {
  if (!is_valid_table_name(config.table_name)) {
    throw std::invalid_argument("invalid table name '" + config.table_name +
                                "' (use [A-Za-z0-9_], starting with a letter)");
  }
  if (config.embedding_dims == 0) {
    throw std::invalid_argument("embedding_dims must be a positive integer");
  }
  if (config.database_path.empty()) {
    throw std::invalid_argument("database_path must not be empty");
  }
}

StoreConfig store_config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("store config must be a JSON object");
  }

  StoreConfig config;
  config.database_path = string_option(j, "database_path", config.database_path);
  config.table_name = string_option(j, "table_name", config.table_name);

  if (!j.contains("embedding_dims") || !j["embedding_dims"].is_number_integer() ||
      j["embedding_dims"].get<std::int64_t>() <= 0) {
    throw std::invalid_argument("store config: 'embedding_dims' must be a positive integer");
  }
  config.embedding_dims = j["embedding_dims"].get<std::size_t>();

  if (j.contains("metadata_schema")) {
    config.metadata_schema = schema::schema_from_json(j["metadata_schema"]);
  }

  const auto exists = string_option(j, "exists_policy", std::string(to_string(config.exists_policy)));
  const auto exists_policy = parse_exists_policy(exists);
  if (!exists_policy) {
    throw std::invalid_argument("store config: unknown exists_policy '" + exists +
                                "' (valid: open, overwrite, fail)");
  }
  config.exists_policy = *exists_policy;

  const auto unknown = string_option(j, "unknown_field_policy",
                                     std::string(schema::to_string(config.unknown_field_policy)));
  const auto unknown_policy = schema::parse_unknown_field_policy(unknown);
  if (!unknown_policy) {
    throw std::invalid_argument("store config: unknown unknown_field_policy '" + unknown +
                                "' (valid: reject, drop)");
  }
  config.unknown_field_policy = *unknown_policy;

  if (j.contains("fts_fields")) {
    const auto& fields = j["fts_fields"];
    if (!fields.is_array()) {
      throw std::invalid_argument("store config: 'fts_fields' must be an array of strings");
    }
    config.fts_fields.clear();
    for (const auto& field : fields) {
      if (!field.is_string()) {
        throw std::invalid_argument("store config: 'fts_fields' must be an array of strings");
      }
      config.fts_fields.push_back(field.get<std::string>());
    }
  }

  validate_store_config(config);
  return config;
}

nlohmann::json store_config_to_json(const StoreConfig& config) {
  return nlohmann::json{
      {"database_path", config.database_path},
      {"table_name", config.table_name},
      {"embedding_dims", config.embedding_dims},
      {"metadata_schema", schema::schema_to_json(config.metadata_schema)},
      {"exists_policy", std::string(to_string(config.exists_policy))},
      {"unknown_field_policy", std::string(schema::to_string(config.unknown_field_policy))},
      {"fts_fields", config.fts_fields},
  };
}

StoreConfig load_store_config(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open store config: " + path);
  }

  nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    throw std::invalid_argument("store config is not valid JSON: " + path);
  }
  return store_config_from_json(j);
}

void save_store_config(const std::string& path, const StoreConfig& config) {
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to write store config: " + path);
  }
  file << store_config_to_json(config).dump(2) << "\n";
  if (!file) {
    throw std::runtime_error("Failed to write store config: " + path);
  }
}

}  // namespace docvec::store
