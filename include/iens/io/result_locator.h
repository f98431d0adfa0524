#pragma once
// iens/io/result_locator.h
//
// Resolves user-supplied result patterns to an ordered list of files.
//
// Each pattern is one literal argument (spaces allowed) and may be:
//   - a file path
//   - a directory: the first existing default name inside it is used
//   - a wildcard pattern; '*', '?', '[...]' may appear in any component, and
//     a "**" component matches any number of directories
//       runs/run_*/N_list
//       runs/run_0[1-5]
//       out/**/vacancy_list.txt
//
// Matches are sorted per pattern; the merged list keeps first-seen order and
// drops repeats of the same canonical file.

#include "iens/core/error.h"
#include "iens/core/types.h"

#include <string>
#include <vector>

namespace iens {
namespace io {

struct LocateOptions {
  std::vector<std::string> default_names = {
      "N_list", "N_list.txt", "N_list.xyz",
      "vacancy_list", "vacancy_list.txt", "vacancy_list.xyz",
  };
};

struct PatternMatch {
  std::string pattern;
  u64 matched_count = 0;  // files contributed before de-duplication
};

struct LocateReport {
  std::vector<std::string> files;
  std::vector<PatternMatch> per_pattern;

  bool AllMatched() const {
    for (const auto& p : per_pattern) {
      if (p.matched_count == 0) return false;
    }
    return true;
  }
};

// Expands one wildcard pattern to existing paths (files or directories),
// sorted. A pattern without wildcards yields itself when it exists.
std::vector<std::string> ExpandPattern(const std::string& pattern);

// kInvalidSpec when `patterns` or default_names is empty. Patterns that match
// nothing are reported through per_pattern, not as errors.
bool LocateResults(const std::vector<std::string>& patterns,
                   const LocateOptions& opts,
                   LocateReport* out,
                   Error* err = nullptr);

}  // namespace io
}  // namespace iens
