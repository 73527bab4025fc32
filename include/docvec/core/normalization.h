#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docvec::core {

// Deterministic, locale-independent text utilities.
// - ASCII lowercasing via explicit char math (no std::tolower)
// - bytes >= 0x80 are kept inside tokens untouched, so UTF-8 words stay whole
// - every other byte outside [A-Za-z0-9] is a delimiter

// tokenize_words splits input on ASCII non-alphanumeric delimiters into tokens with
// ASCII letters lower-cased. Tokens shorter than min_length bytes are dropped. Tokens
// are returned in encounter order.
inline std::vector<std::string> tokenize_words(const std::string_view input,
                                               const std::size_t min_length = 1) {
  std::vector<std::string> tokens;
  std::string current;

  auto flush = [&]() {
    if (!current.empty() && current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    const auto byte = static_cast<unsigned char>(ch);
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || byte >= 0x80) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

// trim removes leading and trailing ASCII whitespace (space, tab, CR, LF).
inline std::string trim(const std::string_view input) {
  auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; };

  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

}  // namespace docvec::core
