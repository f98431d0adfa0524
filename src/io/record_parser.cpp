// src/io/record_parser.cpp

#include "iens/io/record_parser.h"

#include "iens/core/logging.h"
#include "iens/io/csv_io.h"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace iens {
namespace io {

namespace {

constexpr usize kNone = static_cast<usize>(-1);

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  usize start = 0;
  while (start < text.size()) {
    const usize nl = text.find('\n', start);
    const usize end = (nl == std::string_view::npos) ? text.size() : nl;
    lines.push_back(text.substr(start, end - start));
    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
  return lines;
}

std::string Lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = detail::LowerAscii(c);
  return out;
}

bool IsNumber(std::string_view tok) {
  double v = 0.0;
  return csv::ParseDouble(tok, &v);
}

// Integral and inside the i64 range.
bool IsIntegralValue(double v) {
  return std::isfinite(v) && std::trunc(v) == v && std::fabs(v) < 9223372036854775808.0;
}

// Exact tag match, or the same integer value when both sides are integral.
bool TypeMatches(std::string_view tag, const std::string& filter) {
  if (tag == filter) return true;
  double a = 0.0;
  double b = 0.0;
  if (!csv::ParseDouble(tag, &a) || !csv::ParseDouble(filter, &b)) return false;
  return IsIntegralValue(a) && IsIntegralValue(b) && a == b;
}

// Column names of an OVITO header: quoted names may contain spaces.
std::vector<std::string> SplitHeaderColumns(std::string_view s) {
  std::vector<std::string> cols;
  usize i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i >= s.size()) break;
    std::string col;
    if (s[i] == '"' || s[i] == '\'') {
      const char q = s[i++];
      while (i < s.size() && s[i] != q) col.push_back(s[i++]);
      if (i < s.size()) ++i;
    } else {
      while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) col.push_back(s[i++]);
    }
    cols.push_back(Lower(col));
  }
  return cols;
}

usize IndexOf(const std::vector<std::string>& cols, std::initializer_list<std::string_view> names) {
  for (std::string_view name : names) {
    for (usize i = 0; i < cols.size(); ++i) {
      if (cols[i] == name) return i;
    }
  }
  return kNone;
}

// Column positions for one row layout.
struct Layout {
  usize fields = 0;
  usize x = kNone;
  usize y = kNone;
  usize z = kNone;
  usize tag = kNone;
};

// Turns accepted coordinates into records, applying the type filter and the
// negative-depth option. Rows without a tag column bypass the filter.
struct RowSink {
  const std::string& source;
  const ParseOptions& opts;
  std::vector<DepthRecord>* out;
  ParseStats* st;

  void Emit(double x, double y, double z, std::optional<std::string_view> tag) {
    if (opts.type_filter && tag && !TypeMatches(*tag, *opts.type_filter)) {
      ++st->filtered_by_type;
      return;
    }
    const double depth = *opts.surface_z - z;
    if (opts.skip_negative && depth < 0.0) {
      ++st->dropped_negative;
      return;
    }
    DepthRecord r;
    r.source_file = source;
    r.depth = depth;
    if (tag) r.species_type = std::string(*tag);
    r.x = x;
    r.y = y;
    r.z = z;
    out->push_back(std::move(r));
  }
};

bool ParseXYZTokens(const std::vector<std::string_view>& tok, const Layout& lay, double* x, double* y, double* z) {
  return csv::ParseDouble(tok[lay.x], x) && csv::ParseDouble(tok[lay.y], y) && csv::ParseDouble(tok[lay.z], z);
}

// Infers the layout of a headerless row; false when the row cannot start one.
bool InferBareLayout(const std::vector<std::string_view>& tok, Layout* lay) {
  const usize n = tok.size();
  if (n < 3) return false;
  Layout l;
  l.fields = n;
  if (n == 3) {
    l.x = 0;
    l.y = 1;
    l.z = 2;
  } else if (!IsNumber(tok[0])) {
    l.tag = 0;
    l.x = 1;
    l.y = 2;
    l.z = 3;
  } else {
    l.x = n - 3;
    l.y = n - 2;
    l.z = n - 1;
  }
  if (!IsNumber(tok[l.x]) || !IsNumber(tok[l.y]) || !IsNumber(tok[l.z])) return false;
  *lay = l;
  return true;
}

struct Box {
  double lo[3] = {0.0, 0.0, 0.0};
  double hi[3] = {0.0, 0.0, 0.0};
};

bool ParseBoundsRow(std::string_view line, double* lo, double* hi) {
  const auto tok = csv::SplitWhitespace(line);
  return tok.size() >= 2 && csv::ParseDouble(tok[0], lo) && csv::ParseDouble(tok[1], hi);
}

// xs/xsu (and y/z twins) are fractions of the box edge.
bool IsScaledName(const std::string& name) { return name.size() >= 2 && name[1] == 's'; }

}  // namespace

std::string_view ToString(RecordFormat f) noexcept {
  switch (f) {
    case RecordFormat::Empty: return "empty";
    case RecordFormat::DefectList: return DefectListParser::kName;
    case RecordFormat::Trajectory: return TrajectoryParser::kName;
  }
  return "unknown";
}

RecordFormat SniffFormat(std::string_view text) {
  for (std::string_view line : SplitLines(text)) {
    line = csv::Trim(line);
    if (line.empty()) continue;
    return detail::StartsWith(line, "ITEM:") ? RecordFormat::Trajectory : RecordFormat::DefectList;
  }
  return RecordFormat::Empty;
}

bool DefectListParser::Parse(std::string_view text,
                             const std::string& source,
                             const ParseOptions& opts,
                             std::vector<DepthRecord>* out,
                             ParseStats* stats,
                             Error* /*err*/) const {
  ParseStats st;
  st.format = std::string(kName);
  std::vector<DepthRecord> recs;
  RowSink sink{source, opts, &recs, &st};

  const auto lines = SplitLines(text);
  Layout lay;
  bool have_layout = false;
  bool seen_data = false;
  bool skip_next = false;  // XYZ comment line

  for (usize li = 0; li < lines.size(); ++li) {
    if (skip_next) {
      skip_next = false;
      continue;
    }
    const std::string_view line = csv::Trim(lines[li]);
    if (line.empty()) continue;

    if (line.front() == '#') {
      if (!seen_data && !have_layout) {
        const auto cols = SplitHeaderColumns(line.substr(1));
        const usize x = IndexOf(cols, {"position.x"});
        const usize y = IndexOf(cols, {"position.y"});
        const usize z = IndexOf(cols, {"position.z"});
        if (x != kNone && y != kNone && z != kNone) {
          lay.fields = cols.size();
          lay.x = x;
          lay.y = y;
          lay.z = z;
          lay.tag = IndexOf(cols, {"particle type", "type", "element", "species"});
          have_layout = true;
        }
      }
      continue;
    }

    const auto tok = csv::SplitWhitespace(line);

    // XYZ: a lone atom count before any data, followed by a comment line.
    if (!seen_data && !have_layout && tok.size() == 1) {
      i64 count = 0;
      if (csv::ParseI64(tok[0], &count) && count >= 0) {
        seen_data = true;
        skip_next = true;
        continue;
      }
    }
    seen_data = true;
    ++st.rows_seen;

    if (!have_layout) {
      if (!InferBareLayout(tok, &lay)) {
        ++st.skipped_lines;
        IENS_LOG_TRACE(source, "line", li + 1, "skipped: cannot infer columns");
        continue;
      }
      have_layout = true;
    }

    double x = 0.0, y = 0.0, z = 0.0;
    if (tok.size() != lay.fields || !ParseXYZTokens(tok, lay, &x, &y, &z)) {
      ++st.skipped_lines;
      IENS_LOG_TRACE(source, "line", li + 1, "skipped: malformed row");
      continue;
    }
    sink.Emit(x, y, z, lay.tag == kNone ? std::nullopt : std::optional<std::string_view>(tok[lay.tag]));
  }

  if (opts.type_filter && have_layout && lay.tag == kNone) {
    IENS_LOG_DEBUG(source, ": no type/element column, type filter not applied");
  }

  st.records = static_cast<u64>(recs.size());
  for (auto& r : recs) out->push_back(std::move(r));
  if (stats) *stats = std::move(st);
  return true;
}

bool TrajectoryParser::Parse(std::string_view text,
                             const std::string& source,
                             const ParseOptions& opts,
                             std::vector<DepthRecord>* out,
                             ParseStats* stats,
                             Error* err) const {
  const auto lines = SplitLines(text);

  Box box;
  bool have_box = false;
  std::optional<u64> declared;

  bool in_atoms = false;
  Layout lay;
  bool scaled[3] = {false, false, false};
  u64 frames = 0;

  std::vector<DepthRecord> current;
  ParseStats frame_st;
  std::vector<DepthRecord> last;
  ParseStats last_st;
  bool have_frame = false;

  auto commit = [&]() {
    if (!in_atoms) return;
    if (declared && *declared != frame_st.rows_seen) {
      IENS_LOG_WARN(source, ": frame declares", *declared, "atoms but", frame_st.rows_seen, "rows were read");
    }
    last = std::move(current);
    last_st = frame_st;
    have_frame = true;
    current.clear();
    in_atoms = false;
  };

  for (usize li = 0; li < lines.size(); ++li) {
    const std::string_view line = csv::Trim(lines[li]);
    if (line.empty()) continue;

    if (detail::StartsWith(line, "ITEM:")) {
      commit();
      if (detail::StartsWith(line, "ITEM: NUMBER OF ATOMS")) {
        declared.reset();
        if (li + 1 < lines.size()) {
          i64 n = 0;
          if (csv::ParseI64(lines[li + 1], &n) && n >= 0) declared = static_cast<u64>(n);
          ++li;
        }
      } else if (detail::StartsWith(line, "ITEM: BOX BOUNDS")) {
        have_box = (li + 3 < lines.size());
        for (int a = 0; a < 3 && have_box; ++a) {
          if (!ParseBoundsRow(lines[li + 1 + a], &box.lo[a], &box.hi[a])) have_box = false;
        }
        li += 3;
      } else if (detail::StartsWith(line, "ITEM: ATOMS")) {
        std::vector<std::string> cols;
        for (auto t : csv::SplitWhitespace(line.substr(11))) cols.push_back(Lower(t));

        lay = Layout{};
        lay.fields = cols.size();
        lay.x = IndexOf(cols, {"x", "xu", "xsu", "xs"});
        lay.y = IndexOf(cols, {"y", "yu", "ysu", "ys"});
        lay.z = IndexOf(cols, {"z", "zu", "zsu", "zs"});
        lay.tag = IndexOf(cols, {"type", "element"});
        if (lay.x == kNone || lay.y == kNone || lay.z == kNone) {
          SetErr(err, ErrorCode::kFormat,
                 source + " line " + std::to_string(li + 1) + ": ITEM: ATOMS lacks x/y/z coordinate columns");
          return false;
        }
        if (opts.type_filter && lay.tag == kNone) {
          SetErr(err, ErrorCode::kFormat,
                 source + " line " + std::to_string(li + 1) + ": type filter '" + *opts.type_filter +
                     "' requested but ITEM: ATOMS has no type column");
          return false;
        }
        scaled[0] = IsScaledName(cols[lay.x]);
        scaled[1] = IsScaledName(cols[lay.y]);
        scaled[2] = IsScaledName(cols[lay.z]);
        if ((scaled[0] || scaled[1] || scaled[2]) && !have_box) {
          SetErr(err, ErrorCode::kFormat,
                 source + " line " + std::to_string(li + 1) + ": scaled coordinates without ITEM: BOX BOUNDS");
          return false;
        }
        in_atoms = true;
        ++frames;
        current.clear();
        frame_st = ParseStats{};
      } else if (detail::StartsWith(line, "ITEM: TIMESTEP")) {
        ++li;
      }
      continue;
    }

    if (!in_atoms) continue;

    ++frame_st.rows_seen;
    const auto tok = csv::SplitWhitespace(line);
    double c[3] = {0.0, 0.0, 0.0};
    if (tok.size() != lay.fields || !ParseXYZTokens(tok, lay, &c[0], &c[1], &c[2])) {
      ++frame_st.skipped_lines;
      continue;
    }
    for (int a = 0; a < 3; ++a) {
      if (scaled[a]) c[a] = box.lo[a] + c[a] * (box.hi[a] - box.lo[a]);
    }
    RowSink sink{source, opts, &current, &frame_st};
    sink.Emit(c[0], c[1], c[2], lay.tag == kNone ? std::nullopt : std::optional<std::string_view>(tok[lay.tag]));
  }
  commit();

  ParseStats st = have_frame ? last_st : ParseStats{};
  st.format = std::string(kName);
  st.frames = frames;
  st.records = static_cast<u64>(last.size());
  for (auto& r : last) out->push_back(std::move(r));
  if (stats) *stats = std::move(st);
  return true;
}

RecordParser MakeParser(RecordFormat format) {
  if (format == RecordFormat::Trajectory) return TrajectoryParser{};
  return DefectListParser{};
}

bool ParseText(std::string_view text,
               const std::string& source,
               const ParseOptions& opts,
               std::vector<DepthRecord>* out,
               ParseStats* stats,
               Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "ParseText: out is null");
    return false;
  }
  if (!opts.surface_z) {
    SetErr(err, ErrorCode::kInvalidSpec, "surface_z is required to convert z to depth (" + source + ")");
    return false;
  }
  if (!std::isfinite(*opts.surface_z)) {
    SetErr(err, ErrorCode::kInvalidSpec, "surface_z must be finite");
    return false;
  }

  const RecordFormat format = SniffFormat(text);
  if (format == RecordFormat::Empty) {
    if (stats) {
      *stats = ParseStats{};
      stats->format = std::string(ToString(format));
    }
    return true;
  }

  const RecordParser parser = MakeParser(format);
  return std::visit(
      [&](const auto& p) { return p.Parse(text, source, opts, out, stats, err); }, parser);
}

bool ParseRecords(const std::string& path,
                  const ParseOptions& opts,
                  std::vector<DepthRecord>* out,
                  ParseStats* stats,
                  Error* err) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    SetErr(err, ErrorCode::kNotFound, "result file not found: " + path);
    return false;
  }
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    SetErr(err, ErrorCode::kIo, "cannot open result file: " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    SetErr(err, ErrorCode::kIo, "failed reading result file: " + path);
    return false;
  }
  const std::string text = buf.str();
  return ParseText(text, path, opts, out, stats, err);
}

}  // namespace io
}  // namespace iens
