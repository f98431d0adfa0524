#pragma once
// iens/core/config.h
//
// Tool configuration (CLI-friendly).
//
// Convention:
//  - CLI uses --key=value or --key value (e.g., --runs=10 --seed 12345).
//  - Values starting with '-' followed by a digit are values, not flags, so
//    --min_depth -5 works.
//  - Arguments without a leading dash are positionals (result patterns).
//  - Unknown keys are stored into `extra` so callers can warn about typos.
//  - Values that fail to parse are collected and reported by Validate().

#include "iens/core/logging.h"
#include "iens/core/types.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace iens {

// --------------------------
// Small key/value argument map
// --------------------------
class ArgMap {
 public:
  ArgMap() = default;

  // `switches` name boolean flags that never consume the following token,
  // so `--no_max_depth run_*/N_list` keeps the pattern positional.
  static ArgMap FromArgv(int argc, char** argv, const std::vector<std::string>& switches = {}) {
    ArgMap m;
    auto is_switch = [&](const std::string& k) {
      return std::find(switches.begin(), switches.end(), k) != switches.end();
    };
    for (int i = 1; i < argc; ++i) {
      std::string_view token(argv[i]);
      if (token.rfind("--", 0) == 0 && token.size() > 2) {
        token.remove_prefix(2);
        const auto eq_pos = token.find('=');
        if (eq_pos != std::string_view::npos) {
          m.kv_.emplace(std::string(token.substr(0, eq_pos)), std::string(token.substr(eq_pos + 1)));
          continue;
        }
        const std::string key(token);
        if (!is_switch(key) && i + 1 < argc && !LooksLikeFlag(argv[i + 1])) {
          m.kv_.emplace(key, std::string(argv[i + 1]));
          ++i;
        } else {
          m.kv_.emplace(key, "true");
        }
      } else if (token.size() > 1 && token[0] == '-' && !LooksLikeNumber(token)) {
        // Single-dash options: "-k value" -> key="k"
        token.remove_prefix(1);
        const std::string key(token);
        if (i + 1 < argc && !LooksLikeFlag(argv[i + 1])) {
          m.kv_.emplace(key, std::string(argv[i + 1]));
          ++i;
        } else {
          m.kv_.emplace(key, "true");
        }
      } else {
        m.positional_.push_back(std::string(token));
      }
    }
    return m;
  }

  bool Has(std::string_view key) const {
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string_view> Get(std::string_view key) const {
    auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return std::nullopt;
    return std::string_view(it->second);
  }

  const std::unordered_map<std::string, std::string>& KV() const { return kv_; }
  const std::vector<std::string>& Positional() const { return positional_; }

 private:
  static bool LooksLikeNumber(std::string_view s) {
    return s.size() > 1 && s[0] == '-' &&
           (std::isdigit(static_cast<unsigned char>(s[1])) != 0 || s[1] == '.');
  }
  static bool LooksLikeFlag(std::string_view s) {
    return !s.empty() && s[0] == '-' && !LooksLikeNumber(s);
  }

  std::unordered_map<std::string, std::string> kv_;
  std::vector<std::string> positional_;
};

namespace detail {

inline std::string_view TrimView(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

inline bool ParseBool(std::string_view s, bool* out) noexcept {
  if (!out) return false;
  if (s.empty()) return false;
  if (EqualsIgnoreCase(s, "1") || EqualsIgnoreCase(s, "true") || EqualsIgnoreCase(s, "yes") ||
      EqualsIgnoreCase(s, "y") || EqualsIgnoreCase(s, "on")) {
    *out = true;
    return true;
  }
  if (EqualsIgnoreCase(s, "0") || EqualsIgnoreCase(s, "false") || EqualsIgnoreCase(s, "no") ||
      EqualsIgnoreCase(s, "n") || EqualsIgnoreCase(s, "off")) {
    *out = false;
    return true;
  }
  return false;
}

inline bool ParseU64(std::string_view s, u64* out) {
  if (!out) return false;
  s = TrimView(s);
  if (s.empty() || s.front() == '-') return false;
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
  if (errno != 0 || end == tmp.c_str() || *end != '\0') return false;
  *out = static_cast<u64>(v);
  return true;
}

inline bool ParseDouble(std::string_view s, double* out) {
  if (!out) return false;
  s = TrimView(s);
  if (s.empty()) return false;
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || end == tmp.c_str() || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

// "lo,hi" or "lo:hi"
inline bool ParseRange(std::string_view s, Range* out) {
  if (!out) return false;
  usize sep = s.find(',');
  if (sep == std::string_view::npos) sep = s.find(':');
  if (sep == std::string_view::npos) return false;
  Range r;
  if (!ParseDouble(s.substr(0, sep), &r.min)) return false;
  if (!ParseDouble(s.substr(sep + 1), &r.max)) return false;
  *out = r;
  return true;
}

// Comma-separated list; empty items are dropped.
inline std::vector<std::string> SplitList(std::string_view s) {
  std::vector<std::string> out;
  usize start = 0;
  while (start <= s.size()) {
    usize pos = s.find(',', start);
    if (pos == std::string_view::npos) pos = s.size();
    const std::string_view item = TrimView(s.substr(start, pos - start));
    if (!item.empty()) out.emplace_back(item);
    start = pos + 1;
  }
  return out;
}

inline bool ParseLogLevel(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  if (EqualsIgnoreCase(s, "trace")) { *out = LogLevel::Trace; return true; }
  if (EqualsIgnoreCase(s, "debug")) { *out = LogLevel::Debug; return true; }
  if (EqualsIgnoreCase(s, "info")) { *out = LogLevel::Info; return true; }
  if (EqualsIgnoreCase(s, "warn") || EqualsIgnoreCase(s, "warning")) { *out = LogLevel::Warn; return true; }
  if (EqualsIgnoreCase(s, "error")) { *out = LogLevel::Error; return true; }
  if (EqualsIgnoreCase(s, "off")) { *out = LogLevel::Off; return true; }
  return false;
}

// Insert unknown keys into a map<string,string>.
inline void StoreExtras(const std::unordered_map<std::string, std::string>& all_kv,
                        const std::vector<std::string>& known_keys,
                        std::unordered_map<std::string, std::string>* out_extra) {
  if (!out_extra) return;
  out_extra->clear();

  auto is_known = [&](const std::string& k) -> bool {
    for (const auto& kk : known_keys) {
      if (k == kk) return true;
    }
    return false;
  };

  for (const auto& kv : all_kv) {
    if (!is_known(kv.first)) {
      (*out_extra)[kv.first] = kv.second;
    }
  }
}

// Shared parse-and-record helper: a bad value is remembered, not ignored.
class FieldReader {
 public:
  FieldReader(const ArgMap& args, std::vector<std::string>* errors) : args_(args), errors_(errors) {}

  void U64(std::string_view key, u64* out) {
    if (auto v = args_.Get(key)) {
      if (!ParseU64(*v, out)) Bad(key, *v, "unsigned integer");
    }
  }
  void Double(std::string_view key, double* out) {
    if (auto v = args_.Get(key)) {
      if (!ParseDouble(*v, out)) Bad(key, *v, "number");
    }
  }
  void OptDouble(std::string_view key, std::optional<double>* out) {
    if (auto v = args_.Get(key)) {
      double d = 0.0;
      if (ParseDouble(*v, &d)) {
        *out = d;
      } else {
        Bad(key, *v, "number");
      }
    }
  }
  void Bool(std::string_view key, bool* out) {
    if (auto v = args_.Get(key)) {
      if (!ParseBool(*v, out)) Bad(key, *v, "boolean");
    }
  }
  void RangeValue(std::string_view key, Range* out) {
    if (auto v = args_.Get(key)) {
      if (!ParseRange(*v, out)) Bad(key, *v, "range lo,hi");
    }
  }
  void String(std::string_view key, std::string* out) {
    if (auto v = args_.Get(key)) *out = std::string(*v);
  }
  void List(std::string_view key, std::vector<std::string>* out) {
    if (auto v = args_.Get(key)) *out = SplitList(*v);
  }
  void Logging(LoggingConfig* cfg) {
    if (auto v = args_.Get("log_level")) {
      if (!ParseLogLevel(*v, &cfg->level)) Bad("log_level", *v, "log level");
    }
    Bool("log_timestamp", &cfg->with_timestamp);
    Bool("log_thread", &cfg->with_thread_id);
  }

 private:
  void Bad(std::string_view key, std::string_view value, std::string_view what) {
    if (!errors_) return;
    std::ostringstream oss;
    oss << "--" << key << "=" << value << " is not a valid " << what;
    errors_->push_back(oss.str());
  }

  const ArgMap& args_;
  std::vector<std::string>* errors_;
};

inline bool FirstError(const std::vector<std::string>& errors, std::string* err) {
  if (errors.empty()) return false;
  if (err) *err = errors.front();
  return true;
}

inline std::string JsonList(const std::vector<std::string>& items) {
  std::ostringstream oss;
  oss << "[";
  for (usize i = 0; i < items.size(); ++i) {
    if (i) oss << ",";
    oss << "\"" << items[i] << "\"";
  }
  oss << "]";
  return oss.str();
}

}  // namespace detail

// --------------------------
// Ensemble preparation (iens_prepare)
// --------------------------
struct PrepareConfig {
  std::string template_dir;
  std::string input;
  std::string out_root;

  u64 runs = 10;
  u64 base_seed = 12345;
  Range x_range{-20.0, 20.0};
  Range y_range{-20.0, 20.0};

  std::vector<std::string> copy_patterns = {"*.data", "*.zbl", "*.tersoff*"};

  // Style::Unknown means "detect from the template".
  Style style = Style::Simple;
  u64 seed_stride = 1000;

  // Template variable names for the three slots.
  std::string var_seed = "seed";
  std::string var_x = "x_pos";
  std::string var_y = "y_pos";
  i32 precision = 6;

  std::string entry_name = "in.lmp";

  // Empty command: prepare folders only.
  std::string command;
  bool halt_on_failure = false;

  LoggingConfig logging;
  std::unordered_map<std::string, std::string> extra;
  std::vector<std::string> parse_errors;

  bool Validate(std::string* err = nullptr) const {
    auto fail = [&](std::string_view msg) {
      if (err) *err = std::string(msg);
      return false;
    };
    if (detail::FirstError(parse_errors, err)) return false;
    if (template_dir.empty()) return fail("--template_dir is required");
    if (input.empty()) return fail("--input is required");
    if (out_root.empty()) return fail("--out is required");
    if (runs == 0) return fail("--runs must be > 0");
    if (!x_range.Valid()) return fail("--x_range must satisfy min <= max");
    if (!y_range.Valid()) return fail("--y_range must satisfy min <= max");
    if (style == Style::LoopRandomXY && seed_stride < 2) return fail("--seed_stride must be >= 2");
    if (precision < 0 || precision > 17) return fail("--precision must be in [0,17]");
    if (entry_name.empty()) return fail("--entry_name must not be empty");
    if (var_seed.empty() || var_x.empty() || var_y.empty()) {
      return fail("template variable names must not be empty");
    }
    return true;
  }

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss << "{"
        << "\"template_dir\":\"" << template_dir << "\","
        << "\"input\":\"" << input << "\","
        << "\"out\":\"" << out_root << "\","
        << "\"runs\":" << runs << ","
        << "\"seed\":" << base_seed << ","
        << "\"x_range\":[" << x_range.min << "," << x_range.max << "],"
        << "\"y_range\":[" << y_range.min << "," << y_range.max << "],"
        << "\"copy\":" << detail::JsonList(copy_patterns) << ","
        << "\"style\":\"" << (style == Style::Unknown ? std::string_view("auto") : ToString(style)) << "\","
        << "\"seed_stride\":" << seed_stride << ","
        << "\"vars\":[\"" << var_seed << "\",\"" << var_x << "\",\"" << var_y << "\"],"
        << "\"entry_name\":\"" << entry_name << "\","
        << "\"command\":\"" << command << "\","
        << "\"halt_on_failure\":" << (halt_on_failure ? "true" : "false")
        << "}";
    return oss.str();
  }

  // Flags that are complete on their own (see ArgMap::FromArgv).
  static std::vector<std::string> Switches() { return {"halt_on_failure", "help", "h"}; }

  static PrepareConfig FromArgs(const ArgMap& args) {
    PrepareConfig cfg;
    detail::FieldReader rd(args, &cfg.parse_errors);

    const std::vector<std::string> known = {
        "template_dir", "input", "out", "runs", "seed", "x_range", "y_range", "copy",
        "style", "seed_stride", "var_seed", "var_x", "var_y", "precision", "entry_name",
        "command", "lammps", "halt_on_failure",
        "log_level", "log_timestamp", "log_thread", "help", "h",
    };

    rd.String("template_dir", &cfg.template_dir);
    rd.String("input", &cfg.input);
    rd.String("out", &cfg.out_root);
    rd.U64("runs", &cfg.runs);
    rd.U64("seed", &cfg.base_seed);
    rd.RangeValue("x_range", &cfg.x_range);
    rd.RangeValue("y_range", &cfg.y_range);
    rd.List("copy", &cfg.copy_patterns);

    if (auto v = args.Get("style")) {
      if (detail::EqualsIgnoreCase(*v, "auto")) {
        cfg.style = Style::Unknown;
      } else if (!ParseStyle(*v, &cfg.style)) {
        cfg.parse_errors.push_back("--style=" + std::string(*v) +
                                   " is not one of simple|loop_random_xy|auto");
      }
    }
    rd.U64("seed_stride", &cfg.seed_stride);
    rd.String("var_seed", &cfg.var_seed);
    rd.String("var_x", &cfg.var_x);
    rd.String("var_y", &cfg.var_y);
    {
      u64 p = static_cast<u64>(cfg.precision);
      rd.U64("precision", &p);
      cfg.precision = static_cast<i32>(std::min<u64>(p, 1000));
    }
    rd.String("entry_name", &cfg.entry_name);
    rd.String("command", &cfg.command);
    // --lammps is an alias of --command.
    if (cfg.command.empty()) rd.String("lammps", &cfg.command);
    rd.Bool("halt_on_failure", &cfg.halt_on_failure);
    rd.Logging(&cfg.logging);

    detail::StoreExtras(args.KV(), known, &cfg.extra);
    return cfg;
  }
};

// --------------------------
// Depth-histogram analysis (iens_depth_hist)
// --------------------------
struct AnalyzeConfig {
  std::vector<std::string> patterns;

  // Required: depth = surface_z - z.
  std::optional<double> surface_z;
  double bin_width = 5.0;
  std::optional<double> min_depth = 0.0;
  std::optional<double> max_depth = 250.0;

  // Optional species/type tag filter (e.g. "3" for N in the dumps).
  std::optional<std::string> atom_type;

  std::vector<std::string> default_names = {
      "N_list", "N_list.txt", "N_list.xyz",
      "vacancy_list", "vacancy_list.txt", "vacancy_list.xyz",
  };

  std::string out_csv = "depth_hist.csv";
  std::string summary_tsv;

  LoggingConfig logging;
  std::unordered_map<std::string, std::string> extra;
  std::vector<std::string> parse_errors;

  bool Validate(std::string* err = nullptr) const {
    auto fail = [&](std::string_view msg) {
      if (err) *err = std::string(msg);
      return false;
    };
    if (detail::FirstError(parse_errors, err)) return false;
    if (patterns.empty()) return fail("at least one result file, directory or pattern is required");
    if (!surface_z) return fail("--surface_z is required (depth = surface_z - z)");
    if (!(bin_width > 0.0)) return fail("--bin_width must be > 0");
    if (min_depth && max_depth && !(*min_depth < *max_depth)) {
      return fail("--min_depth must be < --max_depth");
    }
    if (default_names.empty()) return fail("--default_names must not be empty");
    return true;
  }

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss << "{"
        << "\"patterns\":" << detail::JsonList(patterns) << ",";
    if (surface_z) oss << "\"surface_z\":" << *surface_z << ",";
    oss << "\"bin_width\":" << bin_width << ",";
    if (min_depth) oss << "\"min_depth\":" << *min_depth << ",";
    if (max_depth) oss << "\"max_depth\":" << *max_depth << ",";
    if (atom_type) oss << "\"atom_type\":\"" << *atom_type << "\",";
    oss << "\"default_names\":" << detail::JsonList(default_names) << ","
        << "\"out\":\"" << out_csv << "\","
        << "\"summary\":\"" << summary_tsv << "\""
        << "}";
    return oss.str();
  }

  static std::vector<std::string> Switches() { return {"no_min_depth", "no_max_depth", "help", "h"}; }

  static AnalyzeConfig FromArgs(const ArgMap& args) {
    AnalyzeConfig cfg;
    detail::FieldReader rd(args, &cfg.parse_errors);

    const std::vector<std::string> known = {
        "surface_z", "bin_width", "min_depth", "max_depth", "no_min_depth", "no_max_depth",
        "atom_type", "default_names", "out", "summary",
        "log_level", "log_timestamp", "log_thread", "help", "h",
    };

    cfg.patterns = args.Positional();
    rd.OptDouble("surface_z", &cfg.surface_z);
    rd.Double("bin_width", &cfg.bin_width);
    rd.OptDouble("min_depth", &cfg.min_depth);
    rd.OptDouble("max_depth", &cfg.max_depth);

    bool no_min = false;
    bool no_max = false;
    rd.Bool("no_min_depth", &no_min);
    rd.Bool("no_max_depth", &no_max);
    if (no_min) cfg.min_depth.reset();
    if (no_max) cfg.max_depth.reset();

    if (auto v = args.Get("atom_type")) cfg.atom_type = std::string(*v);
    rd.List("default_names", &cfg.default_names);
    rd.String("out", &cfg.out_csv);
    rd.String("summary", &cfg.summary_tsv);
    rd.Logging(&cfg.logging);

    detail::StoreExtras(args.KV(), known, &cfg.extra);
    return cfg;
  }
};

}  // namespace iens
