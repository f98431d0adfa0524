#pragma once
// iens/core/glob.h
//
// Shell-style wildcard matching on single path components.
//
//   *      any run of characters (including none)
//   ?      exactly one character
//   [...]  one character from the set; ranges like a-z; '!' or '^' negates
//
// '/' is never special here: callers split paths into components first.

#include "iens/core/types.h"

#include <string_view>

namespace iens {

namespace detail {

// Matches one '[...]' class at pattern[*pi]; advances *pi past ']'.
// Returns false (and leaves *pi) when the bracket is unterminated.
inline bool MatchClass(std::string_view pattern, usize* pi, char c, bool* matched) {
  usize i = *pi + 1;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }
  bool hit = false;
  bool first = true;
  while (i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      if (c >= pattern[i] && c <= pattern[i + 2]) hit = true;
      i += 3;
    } else {
      if (c == pattern[i]) hit = true;
      ++i;
    }
  }
  if (i >= pattern.size()) return false;
  *pi = i + 1;
  *matched = (hit != negate);
  return true;
}

}  // namespace detail

inline bool HasWildcard(std::string_view s) noexcept {
  return s.find_first_of("*?[") != std::string_view::npos;
}

inline bool MatchWildcard(std::string_view pattern, std::string_view name) {
  usize p = 0;
  usize n = 0;
  usize star_p = std::string_view::npos;
  usize star_n = 0;

  while (n < name.size()) {
    if (p < pattern.size()) {
      const char pc = pattern[p];
      if (pc == '*') {
        star_p = p++;
        star_n = n;
        continue;
      }
      if (pc == '?') {
        ++p;
        ++n;
        continue;
      }
      if (pc == '[') {
        usize next = p;
        bool matched = false;
        if (detail::MatchClass(pattern, &next, name[n], &matched)) {
          if (matched) {
            p = next;
            ++n;
            continue;
          }
        } else if (name[n] == '[') {
          // Unterminated bracket is a literal '['.
          ++p;
          ++n;
          continue;
        }
      } else if (pc == name[n]) {
        ++p;
        ++n;
        continue;
      }
    }
    if (star_p == std::string_view::npos) return false;
    p = star_p + 1;
    n = ++star_n;
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

}  // namespace iens
