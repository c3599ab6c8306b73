#pragma once

#include <string>
#include <string_view>

namespace migen::core {

// Deterministic ASCII-only name transforms.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
//
// - ASCII case mapping via explicit char math (no std::tolower/std::toupper)
// - Any non-alphanumeric byte is a word delimiter
// - No locale dependence, no undefined behavior

inline constexpr char kCaseOffset = 'a' - 'A';

inline bool is_ascii_upper(const char ch) { return ch >= 'A' && ch <= 'Z'; }
inline bool is_ascii_lower(const char ch) { return ch >= 'a' && ch <= 'z'; }
inline bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }
inline bool is_ascii_alnum(const char ch) {
  return is_ascii_upper(ch) || is_ascii_lower(ch) || is_ascii_digit(ch);
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (is_ascii_upper(ch)) {
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// underscore converts a human-readable or CamelCase name into a slug:
// lowercase words joined by single underscores.
// - "AddPostsTable"   -> "add_posts_table"
// - "HTTPServer"      -> "http_server"
// - "add posts-table" -> "add_posts_table"
// Leading, trailing and repeated delimiters are dropped, so the result may be empty.
inline std::string underscore(const std::string_view input) {
  std::string result;
  result.reserve(input.size() + 8);

  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];

    if (!is_ascii_alnum(ch)) {
      if (!result.empty() && result.back() != '_') {
        result.push_back('_');
      }
      continue;
    }

    if (is_ascii_upper(ch) && i > 0 && !result.empty() && result.back() != '_') {
      const char prev = input[i - 1];
      const bool next_is_lower = i + 1 < input.size() && is_ascii_lower(input[i + 1]);
      // Word boundary: "aB", "2B", or the last capital of an acronym ("HTTPServer").
      if (is_ascii_lower(prev) || is_ascii_digit(prev) ||
          (is_ascii_upper(prev) && next_is_lower)) {
        result.push_back('_');
      }
    }

    result.push_back(is_ascii_upper(ch) ? static_cast<char>(ch + kCaseOffset) : ch);
  }

  while (!result.empty() && result.back() == '_') {
    result.pop_back();
  }

  return result;
}

// camelize converts a slug into PascalCase: "add_posts_table" -> "AddPostsTable".
// Only the first letter of each underscore-separated segment is changed.
inline std::string camelize(const std::string_view slug) {
  std::string result;
  result.reserve(slug.size());

  bool start_of_word = true;
  for (const char ch : slug) {
    if (ch == '_') {
      start_of_word = true;
      continue;
    }
    if (start_of_word && is_ascii_lower(ch)) {
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
    start_of_word = false;
  }

  return result;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace migen::core
