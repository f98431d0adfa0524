// src/template/template_store.cpp
//
// Slot lookup and rewriting for LAMMPS-style input templates.
//
// The document is scanned line by line (LF or CRLF). Each recognized slot
// yields one or more byte-range edits; the output is the input with exactly
// those ranges replaced.

#include "iens/template/template_store.h"

#include "iens/core/logging.h"
#include "iens/io/csv_io.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace iens {
namespace tmpl {

namespace {

constexpr usize kMaxCandidates = 30;

struct Span {
  usize begin = 0;
  usize end = 0;  // exclusive
};

struct Edit {
  Span span;
  std::string replacement;
};

// Lines without their terminator ('\n' and an optional preceding '\r').
std::vector<Span> SplitLines(std::string_view text) {
  std::vector<Span> lines;
  usize start = 0;
  while (start < text.size()) {
    usize nl = text.find('\n', start);
    const usize next = (nl == std::string_view::npos) ? text.size() : nl + 1;
    usize end = (nl == std::string_view::npos) ? text.size() : nl;
    if (end > start && text[end - 1] == '\r') --end;
    lines.push_back(Span{start, end});
    start = next;
  }
  return lines;
}

inline bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Reads one whitespace-delimited word starting at *i (after skipping blanks).
// Returns false when no word is present. `require_gap` demands at least one
// blank before the word.
bool NextWord(std::string_view line, usize* i, bool require_gap, std::string_view* word) {
  const usize before = *i;
  while (*i < line.size() && IsSpace(line[*i])) ++(*i);
  if (require_gap && *i == before) return false;
  if (*i >= line.size()) return false;
  const usize start = *i;
  while (*i < line.size() && !IsSpace(line[*i])) ++(*i);
  *word = line.substr(start, *i - start);
  return true;
}

// Matches `variable <var> equal <value>` and returns the value span relative
// to the line. Quoted values span their quotes; unquoted values stop at a
// '#' comment and exclude trailing blanks.
bool MatchAssignment(std::string_view line, std::string_view var, Span* value) {
  usize i = 0;
  std::string_view w;
  if (!NextWord(line, &i, /*require_gap=*/false, &w)) return false;
  if (!detail::EqualsIgnoreCase(w, "variable")) return false;
  if (!NextWord(line, &i, true, &w) || w != var) return false;
  if (!NextWord(line, &i, true, &w) || !detail::EqualsIgnoreCase(w, "equal")) return false;

  const usize after_keyword = i;
  while (i < line.size() && IsSpace(line[i])) ++i;
  if (i == after_keyword || i >= line.size()) return false;

  const usize begin = i;
  usize end = line.size();
  if (line[begin] == '"' || line[begin] == '\'') {
    const usize close = line.find(line[begin], begin + 1);
    end = (close == std::string_view::npos) ? line.size() : close + 1;
  } else {
    const usize hash = line.find('#', begin);
    if (hash != std::string_view::npos) end = hash;
    while (end > begin && IsSpace(line[end - 1])) --end;
  }
  if (end <= begin) return false;
  *value = Span{begin, end};
  return true;
}

// Inner span of a value: quotes stripped.
Span Unquote(std::string_view line, Span v) {
  if (v.end - v.begin >= 2) {
    const char q = line[v.begin];
    if ((q == '"' || q == '\'') && line[v.end - 1] == q) return Span{v.begin + 1, v.end - 1};
  }
  return v;
}

Span TrimSpan(std::string_view s, Span sp) {
  while (sp.begin < sp.end && IsSpace(s[sp.begin])) ++sp.begin;
  while (sp.end > sp.begin && IsSpace(s[sp.end - 1])) --sp.end;
  return sp;
}

// random(lo,hi,seedexpr) located inside `s` within [v.begin, v.end).
struct DrawSpans {
  Span lo;
  Span hi;
  Span seed_expr;
  Span seed_literal;  // empty when seedexpr has no leading integer
};

bool ParseDraw(std::string_view s, Span v, DrawSpans* out) {
  const std::string_view value = s.substr(v.begin, v.end - v.begin);
  const usize at = value.find("random(");
  if (at == std::string_view::npos) return false;

  usize i = v.begin + at + 7;  // past "random("
  std::vector<Span> args;
  usize arg_start = i;
  int depth = 0;
  bool closed = false;
  for (; i < v.end; ++i) {
    const char c = s[i];
    if (c == '(' || c == '{' || c == '[') {
      ++depth;
    } else if ((c == ')' || c == '}' || c == ']') && depth > 0) {
      --depth;
    } else if (c == ',' && depth == 0) {
      args.push_back(Span{arg_start, i});
      arg_start = i + 1;
    } else if (c == ')' && depth == 0) {
      args.push_back(Span{arg_start, i});
      closed = true;
      break;
    }
  }
  if (!closed || args.size() != 3) return false;

  DrawSpans d;
  d.lo = TrimSpan(s, args[0]);
  d.hi = TrimSpan(s, args[1]);
  d.seed_expr = TrimSpan(s, args[2]);
  usize k = d.seed_expr.begin;
  while (k < d.seed_expr.end && std::isdigit(static_cast<unsigned char>(s[k])) != 0) ++k;
  d.seed_literal = Span{d.seed_expr.begin, k};
  *out = d;
  return true;
}

std::string SlotLabel(const SubstitutionSpec& spec, Slot slot) {
  return std::string(ToString(slot)) + " (`variable " + spec.VarName(slot) + " equal ...`)";
}

bool ValidateSpec(const SubstitutionSpec& spec, Error* err) {
  if (spec.style != Style::Simple && spec.style != Style::LoopRandomXY) {
    SetErr(err, ErrorCode::kInvalidSpec, "substitution style must be simple or loop_random_xy");
    return false;
  }
  if (spec.seed_var.empty() || spec.x_var.empty() || spec.y_var.empty()) {
    SetErr(err, ErrorCode::kInvalidSpec, "template variable names must not be empty");
    return false;
  }
  if (spec.seed_var == spec.x_var || spec.seed_var == spec.y_var || spec.x_var == spec.y_var) {
    SetErr(err, ErrorCode::kInvalidSpec,
           "template variable names must be distinct: seed=" + spec.seed_var + " x=" + spec.x_var +
               " y=" + spec.y_var);
    return false;
  }
  return true;
}

std::string DocName(const Document& doc) {
  return doc.path.empty() ? std::string("<template>") : doc.path;
}

std::vector<std::string> CandidateInputs(const fs::path& dir) {
  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return names;
  for (const auto& entry : it) {
    std::error_code fec;
    if (!entry.is_regular_file(fec)) continue;
    const std::string name = entry.path().filename().string();
    const std::string ext = entry.path().extension().string();
    if (detail::EqualsIgnoreCase(ext, ".txt") || detail::EqualsIgnoreCase(ext, ".data") ||
        detail::EqualsIgnoreCase(ext, ".lmp") || detail::EqualsIgnoreCase(ext, ".in") ||
        detail::StartsWith(name, "in.")) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  if (names.size() > kMaxCandidates) names.resize(kMaxCandidates);
  return names;
}

}  // namespace

std::string FormatFixed(double v, i32 precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << v;
  return oss.str();
}

std::string FormatShortest(double v) {
  std::ostringstream oss;
  oss << std::setprecision(15) << v;
  return oss.str();
}

bool LoadDocument(const std::string& path, Document* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "LoadDocument: out is null");
    return false;
  }
  std::error_code ec;
  const fs::path p(path);
  if (!fs::exists(p, ec)) {
    SetErr(err, ErrorCode::kNotFound, "template input not found: " + path);
    return false;
  }
  if (fs::is_directory(p, ec)) {
    SetErr(err, ErrorCode::kNotFound, "template input is a directory, not a file: " + path);
    return false;
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    SetErr(err, ErrorCode::kIo, "cannot open template input: " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    SetErr(err, ErrorCode::kIo, "failed reading template input: " + path);
    return false;
  }

  out->path = path;
  out->text = buf.str();
  return true;
}

bool LoadTemplate(const std::string& template_dir,
                  const std::string& input,
                  Document* out,
                  Error* err) {
  std::error_code ec;
  const fs::path dir(template_dir);
  if (!fs::is_directory(dir, ec)) {
    SetErr(err, ErrorCode::kNotFound, "template directory not found: " + template_dir);
    return false;
  }

  const fs::path input_path(input);
  const fs::path tried = input_path.is_absolute() ? input_path : dir / input_path;
  if (fs::exists(tried, ec) && !fs::is_directory(tried, ec)) {
    return LoadDocument(tried.string(), out, err);
  }

  std::ostringstream msg;
  msg << "template input not found\n"
      << "  template_dir: " << template_dir << "\n"
      << "  input:        " << input << "\n"
      << "  tried:        " << tried.string() << "\n"
      << "  candidates in template_dir:\n";
  const std::vector<std::string> candidates = CandidateInputs(dir);
  if (candidates.empty()) {
    msg << "    (none)";
  } else {
    for (usize i = 0; i < candidates.size(); ++i) {
      msg << "    - " << candidates[i];
      if (i + 1 < candidates.size()) msg << "\n";
    }
  }
  SetErr(err, ErrorCode::kNotFound, msg.str());
  return false;
}

bool SaveDocument(const std::string& path, const Document& doc, Error* err) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    SetErr(err, ErrorCode::kIo, "cannot open for writing: " + path);
    return false;
  }
  out.write(doc.text.data(), static_cast<std::streamsize>(doc.text.size()));
  out.flush();
  if (!out) {
    SetErr(err, ErrorCode::kIo, "write failed: " + path);
    return false;
  }
  return true;
}

bool Substitute(const Document& doc,
                const SubstitutionSpec& spec,
                const ensemble::RunConfig& run,
                Document* out,
                Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "Substitute: out is null");
    return false;
  }
  if (!ValidateSpec(spec, err)) return false;
  if (run.style != spec.style) {
    SetErr(err, ErrorCode::kInvalidSpec,
           "run " + run.run_id + " was planned for style " + std::string(ToString(run.style)) +
               " but the template is rewritten as " + std::string(ToString(spec.style)));
    return false;
  }

  const std::string_view text(doc.text);
  const bool loop = (spec.style == Style::LoopRandomXY);

  bool found_seed = false;
  bool found_x = false;
  bool found_y = false;
  bool draw_without_literal = false;
  std::vector<Edit> edits;

  for (const Span& ln : SplitLines(text)) {
    const std::string_view line = text.substr(ln.begin, ln.end - ln.begin);
    Span v;

    if (MatchAssignment(line, spec.seed_var, &v)) {
      found_seed = true;
      edits.push_back(Edit{Span{ln.begin + v.begin, ln.begin + v.end}, std::to_string(run.seed)});
      continue;
    }

    for (const Slot slot : {Slot::XPosition, Slot::YPosition}) {
      if (!MatchAssignment(line, spec.VarName(slot), &v)) continue;
      const bool is_x = (slot == Slot::XPosition);
      (is_x ? found_x : found_y) = true;

      const Span inner = Unquote(line, v);
      DrawSpans draw;
      const bool is_draw = ParseDraw(line, inner, &draw);

      if (!loop) {
        if (is_draw) {
          SetErr(err, ErrorCode::kInvalidSpec,
                 DocName(doc) + ": slot " + SlotLabel(spec, slot) +
                     " is a random(lo,hi,seed) draw; rewrite it with style loop_random_xy");
          return false;
        }
        const double pos = is_x ? run.x_position : run.y_position;
        edits.push_back(Edit{Span{ln.begin + v.begin, ln.begin + v.end}, FormatFixed(pos, spec.precision)});
        continue;
      }

      if (!is_draw) {
        SetErr(err, ErrorCode::kInvalidSpec,
               DocName(doc) + ": slot " + SlotLabel(spec, slot) +
                   " is not a random(lo,hi,seed) draw; rewrite it with style simple");
        return false;
      }
      const Range& r = is_x ? run.x_range : run.y_range;
      const u64 offset = is_x ? run.seed : run.y_seed;
      edits.push_back(Edit{Span{ln.begin + draw.lo.begin, ln.begin + draw.lo.end}, FormatShortest(r.min)});
      edits.push_back(Edit{Span{ln.begin + draw.hi.begin, ln.begin + draw.hi.end}, FormatShortest(r.max)});
      if (draw.seed_literal.end > draw.seed_literal.begin) {
        edits.push_back(Edit{Span{ln.begin + draw.seed_literal.begin, ln.begin + draw.seed_literal.end},
                             std::to_string(offset)});
      } else {
        draw_without_literal = true;
      }
    }
  }

  std::vector<std::string> missing;
  if (!found_seed && (!loop || draw_without_literal)) missing.push_back(SlotLabel(spec, Slot::Seed));
  if (!found_x) missing.push_back(SlotLabel(spec, Slot::XPosition));
  if (!found_y) missing.push_back(SlotLabel(spec, Slot::YPosition));
  if (!missing.empty()) {
    std::string msg = DocName(doc) + ": missing slot";
    msg += (missing.size() > 1) ? "s " : " ";
    for (usize i = 0; i < missing.size(); ++i) {
      if (i) msg += ", ";
      msg += missing[i];
    }
    SetErr(err, ErrorCode::kSlotNotFound, msg);
    return false;
  }

  std::sort(edits.begin(), edits.end(),
            [](const Edit& a, const Edit& b) { return a.span.begin < b.span.begin; });

  std::string rewritten;
  rewritten.reserve(doc.text.size() + 64);
  usize cursor = 0;
  for (const Edit& e : edits) {
    rewritten.append(text.substr(cursor, e.span.begin - cursor));
    rewritten.append(e.replacement);
    cursor = e.span.end;
  }
  rewritten.append(text.substr(cursor));

  IENS_LOG_DEBUG("Substituted", edits.size(), "value span(s) in", DocName(doc), "for", run.run_id);

  out->path = doc.path;
  out->text = std::move(rewritten);
  return true;
}

bool ReadSlot(const Document& doc,
              const SubstitutionSpec& spec,
              Slot slot,
              SlotValue* out,
              Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "ReadSlot: out is null");
    return false;
  }
  const std::string_view text(doc.text);
  for (const Span& ln : SplitLines(text)) {
    const std::string_view line = text.substr(ln.begin, ln.end - ln.begin);
    Span v;
    if (!MatchAssignment(line, spec.VarName(slot), &v)) continue;

    SlotValue sv;
    sv.raw = std::string(line.substr(v.begin, v.end - v.begin));
    const Span inner = Unquote(line, v);

    double num = 0.0;
    if (csv::ParseDouble(line.substr(inner.begin, inner.end - inner.begin), &num)) sv.number = num;

    DrawSpans draw;
    if (ParseDraw(line, inner, &draw)) {
      sv.random_draw = true;
      csv::ParseDouble(line.substr(draw.lo.begin, draw.lo.end - draw.lo.begin), &sv.bounds.min);
      csv::ParseDouble(line.substr(draw.hi.begin, draw.hi.end - draw.hi.begin), &sv.bounds.max);
      if (draw.seed_literal.end > draw.seed_literal.begin) {
        const std::string_view lit =
            line.substr(draw.seed_literal.begin, draw.seed_literal.end - draw.seed_literal.begin);
        u64 offset = 0;
        if (!csv::ParseU64(lit, &offset)) {
          SetErr(err, ErrorCode::kInvalidSpec,
                 DocName(doc) + ": seed literal " + std::string(lit) + " of slot " + SlotLabel(spec, slot) +
                     " does not fit in 64 bits");
          return false;
        }
        sv.seed_offset = offset;
      }
      sv.seed_tail = std::string(line.substr(draw.seed_literal.end, draw.seed_expr.end - draw.seed_literal.end));
    }
    *out = std::move(sv);
    return true;
  }

  SetErr(err, ErrorCode::kSlotNotFound, DocName(doc) + ": missing slot " + SlotLabel(spec, slot));
  return false;
}

Style DetectStyle(const Document& doc, const SubstitutionSpec& spec) {
  const std::string_view text(doc.text);
  for (const Span& ln : SplitLines(text)) {
    const std::string_view line = text.substr(ln.begin, ln.end - ln.begin);
    Span v;
    if (!MatchAssignment(line, spec.x_var, &v)) continue;
    DrawSpans draw;
    return ParseDraw(line, Unquote(line, v), &draw) ? Style::LoopRandomXY : Style::Simple;
  }
  return Style::Unknown;
}

}  // namespace tmpl
}  // namespace iens
