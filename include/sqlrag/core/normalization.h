#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrag::core {

// Locale-independent text helpers. ASCII letters are case-folded with explicit char
// math; bytes >= 0x80 (UTF-8 sequences) pass through untouched, so CJK queries
// survive every transformation byte-for-byte.

[[nodiscard]] inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

[[nodiscard]] inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    constexpr char kCaseOffset = 'a' - 'A';
    out.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + kCaseOffset) : ch);
  }
  return out;
}

[[nodiscard]] inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    constexpr char kCaseOffset = 'a' - 'A';
    out.push_back((ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - kCaseOffset) : ch);
  }
  return out;
}

// tokenize_text splits input into lookup tokens:
// - runs of ASCII letters/digits become one lower-cased token, dropped when shorter
//   than min_ascii_length
// - every multi-byte UTF-8 code point becomes its own token (CJK has no spaces)
// - everything else is a delimiter
// Tokens are returned in encounter order.
[[nodiscard]] inline std::vector<std::string> tokenize_text(const std::string_view input,
                                                            const std::size_t min_ascii_length = 2) {
  std::vector<std::string> tokens;
  std::string current;

  const auto flush = [&]() {
    if (!current.empty() && current.size() >= min_ascii_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  std::size_t i = 0;
  while (i < input.size()) {
    const auto byte = static_cast<unsigned char>(input[i]);
    if (byte >= 0x80) {
      flush();
      std::size_t len = 1;
      if ((byte & 0xE0) == 0xC0) {
        len = 2;
      } else if ((byte & 0xF0) == 0xE0) {
        len = 3;
      } else if ((byte & 0xF8) == 0xF0) {
        len = 4;
      }
      len = std::min(len, input.size() - i);
      tokens.emplace_back(input.substr(i, len));
      i += len;
      continue;
    }

    const char ch = input[i];
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
    ++i;
  }
  flush();

  return tokens;
}

// trim removes leading and trailing ASCII whitespace.
[[nodiscard]] inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// split_trimmed splits on delimiter, trims each piece and drops empty pieces.
[[nodiscard]] inline std::vector<std::string> split_trimmed(const std::string_view input,
                                                            const char delimiter) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= input.size()) {
    const std::size_t pos = input.find(delimiter, start);
    const std::size_t end = (pos == std::string_view::npos) ? input.size() : pos;
    std::string piece = trim(input.substr(start, end - start));
    if (!piece.empty()) {
      parts.push_back(std::move(piece));
    }
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return parts;
}

template <typename Range>
[[nodiscard]] std::string join(const Range& items, const std::string_view separator) {
  std::string out;
  bool first = true;
  for (const auto& item : items) {
    if (!first) {
      out += separator;
    }
    out += item;
    first = false;
  }
  return out;
}

// starts_with_keyword_ci: input (after leading whitespace and opening parentheses)
// begins with keyword as a whole word, ASCII case-insensitive.
[[nodiscard]] inline bool starts_with_keyword_ci(const std::string_view input,
                                                 const std::string_view keyword) {
  std::size_t i = 0;
  while (i < input.size() && (is_ascii_space(input[i]) || input[i] == '(')) {
    ++i;
  }
  if (input.size() - i < keyword.size()) {
    return false;
  }
  if (normalize_ascii_upper(input.substr(i, keyword.size())) != normalize_ascii_upper(keyword)) {
    return false;
  }
  const std::size_t after = i + keyword.size();
  if (after == input.size()) {
    return true;
  }
  const char next = input[after];
  const bool word_char = (next >= 'a' && next <= 'z') || (next >= 'A' && next <= 'Z') ||
                         (next >= '0' && next <= '9') || next == '_';
  return !word_char;
}

}  // namespace sqlrag::core
