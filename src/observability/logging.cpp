#include "docvec/observability/logging.h"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace docvec::observability {

namespace {

constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";
constexpr spdlog::level::level_enum kDefaultLevel = spdlog::level::warn;

spdlog::level::level_enum level_from_env() {
  if (const char* name = std::getenv(kLogLevelEnv)) {
    if (auto level = parse_log_level(name)) {
      return *level;
    }
  }
  return kDefaultLevel;
}

// The logger is created on first use so that code running before init_logging
// still reaches stderr, never stdout (the CLI prints results there).
std::shared_ptr<spdlog::logger> docvec_logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern(kPattern);
    created->set_level(level_from_env());
    created->flush_on(spdlog::level::warn);
    return created;
  }();
  return logger;
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

}  // namespace

LogField string_field(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "critical") {
    return spdlog::level::critical;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

void init_logging(const std::optional<std::string>& level) {
  spdlog::level::level_enum resolved = level_from_env();
  if (level) {
    auto parsed = parse_log_level(*level);
    if (!parsed) {
      throw std::invalid_argument("unknown log level '" + *level +
                                  "' (expected trace|debug|info|warn|error|critical|off)");
    }
    resolved = *parsed;
  }
  docvec_logger()->set_level(resolved);
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  const auto& logger = docvec_logger();
  if (!logger->should_log(level)) {
    return;
  }

  auto serialized_fields = serialize_fields(fields);
  if (!serialized_fields.empty()) {
    logger->log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger->log(level, "{}", message);
}

}  // namespace docvec::observability
