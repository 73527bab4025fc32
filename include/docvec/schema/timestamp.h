#pragma once

#include <string_view>

namespace docvec::schema {

// is_iso8601_timestamp accepts exactly these forms (no zone designator):
//   YYYY-MM-DD
//   YYYY-MM-DDTHH:MM:SS
//   YYYY-MM-DDTHH:MM:SS.f   (one or more fraction digits)
// Month, day, hour, minute and second ranges are checked; day-of-month is checked
// against the month length including leap years.
//
// Values are stored as written. The same instant can be written several ways
// ("2024-01-01", "2024-01-01T00:00:00", "...T00:00:00.50"), so byte order is not
// chronological order; filters compare through the engine's julianday(), which
// resolves to milliseconds.
[[nodiscard]] bool is_iso8601_timestamp(std::string_view text);

}  // namespace docvec::schema
