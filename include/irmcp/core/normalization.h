#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace irmcp::core {

// Deterministic ASCII-only text utilities shared by the capability implementations.
// All functions are locale-independent: A-Z is folded via explicit char math and
// non-ASCII bytes (UTF-8 continuation bytes included) pass through untouched.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// contains_ignore_case reports whether needle occurs in haystack, comparing ASCII
// letters case-insensitively. An empty needle matches everything.
inline bool contains_ignore_case(const std::string_view haystack, const std::string_view needle) {
  return normalize_ascii_lower(haystack).find(normalize_ascii_lower(needle)) != std::string::npos;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
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

// split_lines splits text on '\n'. Each returned line keeps no terminator; a trailing
// '\r' is preserved so callers that trim see the same text either way.
// A final newline does not produce an empty trailing line.
inline std::vector<std::string> split_lines(const std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

// join concatenates parts with sep between consecutive elements.
inline std::string join(const std::vector<std::string>& parts, const std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

}  // namespace irmcp::core
