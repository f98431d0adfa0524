#pragma once
// iens/analysis/histogram.h
//
// Fixed-width depth histogram over records merged from many files.
//
// Domain: records outside [min_depth, max_depth) are dropped and counted.
// Origin: min_depth when a lower clip is set, otherwise the smallest retained
// depth. Bin k covers [origin + k*w, origin + (k+1)*w); every bin from 0 to
// the highest occupied one is emitted, empty ones included. When max_depth
// falls inside the last bin, that bin ends at max_depth.
//
// Invariants of a successful Aggregate():
//   sum(bin.count) == total == records - dropped_below - dropped_above
//   bins[i].end == bins[i+1].start (exact, same expression on both sides)

#include "iens/core/error.h"
#include "iens/core/stats.h"
#include "iens/core/types.h"
#include "iens/io/depth_record.h"

#include <optional>
#include <string>
#include <vector>

namespace iens {
namespace analysis {

// Upper bound on the bins one Aggregate() call may emit.
inline constexpr usize kMaxBins = 10000000;

struct HistogramSpec {
  double bin_width = 5.0;
  std::optional<double> min_depth;  // inclusive
  std::optional<double> max_depth;  // exclusive
};

struct Bin {
  double start = 0.0;
  double end = 0.0;
  u64 count = 0;
};

struct HistogramResult {
  std::vector<Bin> bins;
  u64 total = 0;
  u64 dropped_below = 0;
  u64 dropped_above = 0;
};

// kInvalidSpec: bin_width not finite or <= 0, non-finite clip, min >= max,
// non-finite depth, or a retained span needing kMaxBins bins or more.
bool Aggregate(const std::vector<io::DepthRecord>& records,
               const HistogramSpec& spec,
               HistogramResult* out,
               Error* err = nullptr);

// Per-file figures printed by the analysis tool.
struct SourceSummary {
  std::string source_file;
  u64 count = 0;
  double mean_depth = 0.0;          // NaN when count == 0
  double mean_pair_distance = 0.0;  // NaN when count < 2
};

// Mean Euclidean distance over all unordered pairs of points.
double MeanPairDistance(const std::vector<io::DepthRecord>& records);

// One entry per distinct source_file, in first-seen order.
std::vector<SourceSummary> SummarizeSources(const std::vector<io::DepthRecord>& records);

// Summary over all record depths (mean/stdev/median/p90).
Summary SummarizeDepths(const std::vector<io::DepthRecord>& records);

}  // namespace analysis
}  // namespace iens
