// src/io/result_locator.cpp

#include "iens/io/result_locator.h"

#include "iens/core/glob.h"
#include "iens/core/logging.h"

#include <algorithm>
#include <filesystem>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace iens {
namespace io {

namespace {

fs::path ListingDir(const fs::path& base) { return base.empty() ? fs::path(".") : base; }

void AppendMatchingChildren(const fs::path& base, const std::string& component, std::vector<fs::path>* out) {
  std::error_code ec;
  fs::directory_iterator it(ListingDir(base), ec);
  if (ec) return;
  const bool want_hidden = !component.empty() && component.front() == '.';
  for (const auto& entry : it) {
    const std::string name = entry.path().filename().string();
    if (!want_hidden && !name.empty() && name.front() == '.') continue;
    if (MatchWildcard(component, name)) out->push_back(base / name);
  }
}

// `base` itself plus every directory below it.
void AppendDirectoryTree(const fs::path& base, std::vector<fs::path>* out) {
  out->push_back(base);
  std::error_code ec;
  fs::recursive_directory_iterator it(ListingDir(base), fs::directory_options::skip_permission_denied, ec);
  if (ec) return;
  const fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) break;
    std::error_code dec;
    if (it->is_directory(dec)) {
      const fs::path rel = it->path().lexically_relative(ListingDir(base));
      out->push_back(base / rel);
    }
  }
}

std::string FirstDefaultName(const fs::path& dir, const std::vector<std::string>& names) {
  for (const auto& n : names) {
    std::error_code ec;
    const fs::path cand = dir / n;
    if (fs::is_regular_file(cand, ec)) return cand.string();
  }
  return std::string();
}

std::string CanonicalKey(const std::string& path) {
  std::error_code ec;
  const fs::path c = fs::weakly_canonical(path, ec);
  return ec ? fs::absolute(path, ec).lexically_normal().string() : c.string();
}

}  // namespace

std::vector<std::string> ExpandPattern(const std::string& pattern) {
  std::vector<std::string> result;
  std::error_code ec;
  if (!HasWildcard(pattern)) {
    if (fs::exists(pattern, ec)) result.push_back(pattern);
    return result;
  }

  const fs::path p(pattern);
  std::vector<fs::path> current = {p.root_path()};
  for (const auto& comp_path : p.relative_path()) {
    const std::string comp = comp_path.string();
    if (comp.empty()) continue;
    std::vector<fs::path> next;
    for (const auto& base : current) {
      if (comp == "**") {
        AppendDirectoryTree(base, &next);
      } else if (HasWildcard(comp)) {
        AppendMatchingChildren(base, comp, &next);
      } else {
        next.push_back(base / comp);
      }
    }
    std::sort(next.begin(), next.end());
    next.erase(std::unique(next.begin(), next.end()), next.end());
    current = std::move(next);
    if (current.empty()) break;
  }

  for (const auto& c : current) {
    if (!c.empty() && fs::exists(c, ec)) result.push_back(c.string());
  }
  return result;
}

bool LocateResults(const std::vector<std::string>& patterns,
                   const LocateOptions& opts,
                   LocateReport* out,
                   Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "LocateResults: out is null");
    return false;
  }
  if (patterns.empty()) {
    SetErr(err, ErrorCode::kInvalidSpec, "no result patterns given");
    return false;
  }
  if (opts.default_names.empty()) {
    SetErr(err, ErrorCode::kInvalidSpec, "default result names must not be empty");
    return false;
  }

  LocateReport rep;
  std::unordered_set<std::string> seen;
  for (const auto& pattern : patterns) {
    PatternMatch pm;
    pm.pattern = pattern;
    for (const auto& hit : ExpandPattern(pattern)) {
      std::error_code ec;
      std::string file = hit;
      if (fs::is_directory(hit, ec)) {
        file = FirstDefaultName(hit, opts.default_names);
        if (file.empty()) {
          IENS_LOG_DEBUG("No default result file in", hit);
          continue;
        }
      } else if (!fs::is_regular_file(hit, ec)) {
        continue;
      }
      ++pm.matched_count;
      if (seen.insert(CanonicalKey(file)).second) rep.files.push_back(file);
    }
    IENS_LOG_DEBUG("Pattern", pattern, "->", pm.matched_count, "file(s)");
    rep.per_pattern.push_back(std::move(pm));
  }

  *out = std::move(rep);
  return true;
}

}  // namespace io
}  // namespace iens
