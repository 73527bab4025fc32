#include "docvec/schema/timestamp.h"

#include <catch2/catch.hpp>

using docvec::schema::is_iso8601_timestamp;

TEST_CASE("is_iso8601_timestamp: accepts date, datetime and fractional forms",
          "[schema][timestamp]") {
  CHECK(is_iso8601_timestamp("2024-03-15"));
  CHECK(is_iso8601_timestamp("2024-03-15T09:30:00"));
  CHECK(is_iso8601_timestamp("2024-03-15T09:30:00.5"));
  CHECK(is_iso8601_timestamp("2024-03-15T23:59:59.123456"));
}

TEST_CASE("is_iso8601_timestamp: checks day of month including leap years",
          "[schema][timestamp]") {
  CHECK(is_iso8601_timestamp("2024-02-29"));
  CHECK_FALSE(is_iso8601_timestamp("2023-02-29"));
  CHECK(is_iso8601_timestamp("2000-02-29"));
  CHECK_FALSE(is_iso8601_timestamp("1900-02-29"));
  CHECK_FALSE(is_iso8601_timestamp("2024-04-31"));
  CHECK_FALSE(is_iso8601_timestamp("2024-13-01"));
  CHECK_FALSE(is_iso8601_timestamp("2024-00-10"));
}

TEST_CASE("is_iso8601_timestamp: rejects zones, separators and partial times",
          "[schema][timestamp]") {
  CHECK_FALSE(is_iso8601_timestamp(""));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15Z"));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15T09:30:00Z"));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15T09:30:00+01:00"));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15 09:30:00"));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15T09:30"));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15T24:00:00"));
  CHECK_FALSE(is_iso8601_timestamp("2024-03-15T09:30:00."));
  CHECK_FALSE(is_iso8601_timestamp("2024/03/15"));
  CHECK_FALSE(is_iso8601_timestamp("15-03-2024"));
}
