#pragma once
// iens/core/assert.h
//
// Always-on comparison checks for internal invariants (histogram mass
// conservation). User-facing failures go through iens::Error instead.

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace iens {
namespace detail {

template <class T>
inline void PrintValue(std::ostream& os, const T& v) {
  if constexpr (std::is_same_v<T, bool>) {
    os << (v ? "true" : "false");
  } else {
    os << v;
  }
}

template <class A, class B>
[[noreturn]] inline void CheckFail(const char* a_expr,
                                  const char* b_expr,
                                  const char* op,
                                  const A& a_val,
                                  const B& b_val,
                                  const char* file,
                                  int line,
                                  const char* func) {
  std::ostringstream oss;
  oss << "[IENS][CHECK] " << file << ":" << line << " in " << func << "\n"
      << "  check: (" << a_expr << ") " << op << " (" << b_expr << ")\n"
      << "  lhs  : ";
  PrintValue(oss, a_val);
  oss << "\n  rhs  : ";
  PrintValue(oss, b_val);
  oss << "\n";
  std::cerr << oss.str() << std::flush;
  std::abort();
}

}  // namespace detail
}  // namespace iens

#if defined(__GNUC__) || defined(__clang__)
  #define IENS_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
  #define IENS_UNLIKELY(x) (x)
#endif

#define IENS_CHECK_OP(a, b, op)                                                          \
  do {                                                                                   \
    const auto& _iens_a = (a);                                                           \
    const auto& _iens_b = (b);                                                           \
    if (IENS_UNLIKELY(!(_iens_a op _iens_b))) {                                          \
      ::iens::detail::CheckFail(#a, #b, #op, _iens_a, _iens_b, __FILE__, __LINE__, __func__); \
    }                                                                                    \
  } while (0)

#define IENS_CHECK_EQ(a, b) IENS_CHECK_OP(a, b, ==)
