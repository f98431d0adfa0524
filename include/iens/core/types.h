#pragma once
// iens/core/types.h
//
// Core, dependency-light types shared across the project.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace iens {

// --------------------------
// Fixed-width integer aliases
// --------------------------
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;

// Closed numeric interval used for injection coordinates.
struct Range {
  double min = 0.0;
  double max = 0.0;

  constexpr Range() = default;
  constexpr Range(double lo, double hi) : min(lo), max(hi) {}

  constexpr bool Valid() const noexcept { return min <= max; }
  constexpr bool Contains(double v) const noexcept { return v >= min && v <= max; }

  friend constexpr bool operator==(const Range& a, const Range& b) noexcept {
    return a.min == b.min && a.max == b.max;
  }
  friend constexpr bool operator!=(const Range& a, const Range& b) noexcept {
    return !(a == b);
  }
};

inline std::ostream& operator<<(std::ostream& os, const Range& r) {
  os << '(' << r.min << ',' << r.max << ')';
  return os;
}

// --------------------------
// Template rewrite style
// --------------------------
// Simple:       `variable x_pos equal 1.234` gets its value replaced.
// LoopRandomXY: `variable x_pos equal random(-20,20,12345+${i})` gets its
//               bounds and leading seed literal replaced; the draw itself
//               happens inside the simulator.
enum class Style : u8 {
  Simple = 0,
  LoopRandomXY = 1,
  Unknown = 255,
};

inline constexpr std::string_view ToString(Style s) noexcept {
  switch (s) {
    case Style::Simple: return "simple";
    case Style::LoopRandomXY: return "loop_random_xy";
    case Style::Unknown: return "unknown";
  }
  return "unknown";
}

namespace detail {
inline constexpr char LowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (usize i = 0; i < a.size(); ++i) {
    if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
  }
  return true;
}
inline bool StartsWith(std::string_view s, std::string_view prefix) noexcept {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}
}  // namespace detail

inline bool ParseStyle(std::string_view s, Style* out) noexcept {
  if (!out) return false;
  if (detail::EqualsIgnoreCase(s, "simple")) { *out = Style::Simple; return true; }
  if (detail::EqualsIgnoreCase(s, "loop_random_xy") || detail::EqualsIgnoreCase(s, "loop-random-xy") ||
      detail::EqualsIgnoreCase(s, "loop")) {
    *out = Style::LoopRandomXY;
    return true;
  }
  *out = Style::Unknown;
  return false;
}

inline std::ostream& operator<<(std::ostream& os, Style s) {
  os << ToString(s);
  return os;
}

}  // namespace iens
