#pragma once
// iens/io/csv_io.h
//
// Delimited-text utilities.
//
// Primary use in this project:
//  - Write histogram bin tables and per-source summaries for plotting
//  - Append per-run invocation ledgers
//  - Tokenize whitespace-separated result rows (defect lists, dumps)
//
// Writer supports proper escaping for separators/quotes/newlines.
// The tokenizers do NOT support quoted separators; result files never use them.

#include "iens/core/types.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace iens {
namespace csv {

struct Dialect {
  char sep = ',';          // ',' for CSV, '\t' for TSV
  char quote = '"';
  bool always_quote = false;
  bool write_header = true;
};

inline void SetErr(std::string* err, const std::string& msg) {
  if (err) *err = msg;
}

// Escape a cell according to RFC 4180-ish CSV rules:
//  - If cell contains sep/quote/newline, wrap with quotes and double embedded quotes.
//  - If always_quote, always wrap and escape quotes.
inline std::string EscapeCell(std::string_view cell, const Dialect& d) {
  bool need_quote = d.always_quote;
  for (char c : cell) {
    if (c == d.sep || c == d.quote || c == '\n' || c == '\r') {
      need_quote = true;
      break;
    }
  }
  if (!need_quote) return std::string(cell);

  std::string out;
  out.reserve(cell.size() + 2);
  out.push_back(d.quote);
  for (char c : cell) {
    if (c == d.quote) out.push_back(d.quote);
    out.push_back(c);
  }
  out.push_back(d.quote);
  return out;
}

class Writer {
 public:
  Writer() = default;

  // mode: std::ios::out (truncate) or std::ios::out | std::ios::app.
  explicit Writer(const std::string& path,
                  Dialect d = {},
                  std::string* err = nullptr,
                  std::ios::openmode mode = std::ios::out)
      : d_(d), out_(path, mode) {
    if (!out_) {
      SetErr(err, "Cannot open file for writing: " + path);
      ok_ = false;
    } else {
      ok_ = true;
    }
  }

  bool Ok() const noexcept { return ok_ && static_cast<bool>(out_); }

  bool WriteHeader(const std::vector<std::string>& cols, std::string* err = nullptr) {
    if (!Ok()) { SetErr(err, "Writer not ok"); return false; }
    if (!d_.write_header) return true;
    return WriteRow(cols, err);
  }

  bool WriteRow(const std::vector<std::string>& cols, std::string* err = nullptr) {
    if (!Ok()) { SetErr(err, "Writer not ok"); return false; }
    for (usize i = 0; i < cols.size(); ++i) {
      if (i) out_ << d_.sep;
      out_ << EscapeCell(cols[i], d_);
    }
    out_ << "\n";
    if (!out_) {
      SetErr(err, "Write failed");
      return false;
    }
    return true;
  }

  // Variadic row writer, converts each arg via operator<< into a string.
  template <class... Args>
  bool WriteRowV(Args&&... args) {
    if (!Ok()) return false;
    bool first = true;
    auto write_one = [&](auto&& x) {
      if (!first) out_ << d_.sep;
      first = false;
      std::ostringstream oss;
      oss.precision(10);
      oss << std::forward<decltype(x)>(x);
      out_ << EscapeCell(oss.str(), d_);
    };
    (write_one(std::forward<Args>(args)), ...);
    out_ << "\n";
    return static_cast<bool>(out_);
  }

  bool Flush() {
    out_.flush();
    return static_cast<bool>(out_);
  }

 private:
  Dialect d_{};
  std::ofstream out_;
  bool ok_{false};
};

// --------------------------
// Tokenizing / parsing helpers
// --------------------------

inline std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Split on runs of whitespace; no empty tokens are produced.
inline std::vector<std::string_view> SplitWhitespace(std::string_view line) {
  std::vector<std::string_view> out;
  usize i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i >= line.size()) break;
    const usize start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    out.push_back(line.substr(start, i - start));
  }
  return out;
}

// Finite doubles only; trailing garbage fails.
inline bool ParseDouble(std::string_view s, double* out) {
  if (!out) return false;
  s = Trim(s);
  if (s.empty()) return false;
  std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || end == tmp.c_str()) return false;
  while (*end != '\0') {
    if (!std::isspace(static_cast<unsigned char>(*end))) return false;
    ++end;
  }
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseI64(std::string_view s, i64* out) {
  if (!out) return false;
  s = Trim(s);
  if (s.empty()) return false;
  std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(tmp.c_str(), &end, 10);
  if (errno != 0 || end == tmp.c_str() || *end != '\0') return false;
  *out = static_cast<i64>(v);
  return true;
}

inline bool ParseU64(std::string_view s, u64* out) {
  if (!out) return false;
  s = Trim(s);
  if (s.empty() || s.front() == '-') return false;
  std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
  if (errno != 0 || end == tmp.c_str() || *end != '\0') return false;
  *out = static_cast<u64>(v);
  return true;
}

}  // namespace csv
}  // namespace iens
