#pragma once

#include <string>
#include <string_view>

namespace docvec::storage::sqlite {

// quote_identifier renders name as a double-quoted SQL identifier ("meta.page").
// Embedded double quotes are doubled.
inline std::string quote_identifier(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (const char ch : name) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

// quote_string_literal renders value as a single-quoted SQL string literal.
// Embedded single quotes are doubled; no other escaping exists in SQL.
inline std::string quote_string_literal(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (const char ch : value) {
    if (ch == '\'') {
      out.push_back('\'');
    }
    out.push_back(ch);
  }
  out.push_back('\'');
  return out;
}

}  // namespace docvec::storage::sqlite
