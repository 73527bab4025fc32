#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace docvec::observability {

// Name of the spdlog logger every docvec component writes to.
constexpr const char* kLoggerName = "docvec";

// Environment variable consulted when no explicit level is given.
constexpr const char* kLogLevelEnv = "DOCVEC_LOG_LEVEL";

struct LogField {
  std::string key;
  std::string value;
};

[[nodiscard]] LogField string_field(std::string_view key, std::string_view value);
[[nodiscard]] LogField int_field(std::string_view key, std::int64_t value);
[[nodiscard]] LogField bool_field(std::string_view key, bool value);

// parse_log_level accepts trace, debug, info, warn, error, critical and off.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// init_logging sets the level of the docvec logger (a coloured stderr sink).
// Precedence: the explicit level, then $DOCVEC_LOG_LEVEL, then "warn".
// Throws std::invalid_argument for an unrecognised level name.
// The logger exists before init_logging is called, at the env/default level, so
// library code may log at any time.
void init_logging(const std::optional<std::string>& level = std::nullopt);

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::err, message, fields);
}

}  // namespace docvec::observability

#define DOCVEC_LOG_DEBUG(message, ...) ::docvec::observability::log_debug((message), ##__VA_ARGS__)
#define DOCVEC_LOG_INFO(message, ...) ::docvec::observability::log_info((message), ##__VA_ARGS__)
#define DOCVEC_LOG_WARN(message, ...) ::docvec::observability::log_warn((message), ##__VA_ARGS__)
#define DOCVEC_LOG_ERROR(message, ...) ::docvec::observability::log_error((message), ##__VA_ARGS__)
