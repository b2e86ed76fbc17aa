#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace stockcheck {

// -----------------------------------------------------------------------------
// Text utilities
// -----------------------------------------------------------------------------
//
// @brief  ASCII-only helpers for trimming and case-insensitive comparison.
//
// @details
// Card names are compared with ASCII case folding only. Non-ASCII bytes
// (accented letters in localized names) compare byte-for-byte, so "Æther"
// and "æther" are different names. This mirrors how the inventory export
// and the want-list tools have always compared names.
//
// All functions are inline one-liners kept in a header.
//
// Thread-safety: Stateless: safe to call from any thread.
// -----------------------------------------------------------------------------

inline char asciiLower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// -------------------------------------------------------------------------
// trim
// -------------------------------------------------------------------------
// @brief  Returns a view of text without leading and trailing whitespace.
//
// @details
// The returned view aliases the argument; it must not outlive it.
// -------------------------------------------------------------------------
inline std::string_view trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && isSpace(text[begin])) {
    ++begin;
  }
  while (end > begin && isSpace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

inline std::string toLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), asciiLower);
  return out;
}

// -------------------------------------------------------------------------
// iequals
// -------------------------------------------------------------------------
// @brief  Case-insensitive (ASCII) equality of two strings.
//
// @details
// Exact length match required; no trimming, no Unicode folding.
// -------------------------------------------------------------------------
inline bool iequals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (asciiLower(lhs[i]) != asciiLower(rhs[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace stockcheck
