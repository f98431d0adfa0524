// src/analysis/histogram.cpp

#include "iens/analysis/histogram.h"

#include "iens/core/assert.h"
#include "iens/core/logging.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace iens {
namespace analysis {

namespace {

bool ValidateSpec(const HistogramSpec& spec, Error* err) {
  if (!std::isfinite(spec.bin_width) || !(spec.bin_width > 0.0)) {
    std::ostringstream oss;
    oss << "bin_width must be finite and > 0 (got " << spec.bin_width << ")";
    SetErr(err, ErrorCode::kInvalidSpec, oss.str());
    return false;
  }
  if ((spec.min_depth && !std::isfinite(*spec.min_depth)) ||
      (spec.max_depth && !std::isfinite(*spec.max_depth))) {
    SetErr(err, ErrorCode::kInvalidSpec, "depth clips must be finite");
    return false;
  }
  if (spec.min_depth && spec.max_depth && !(*spec.min_depth < *spec.max_depth)) {
    std::ostringstream oss;
    oss << "min_depth (" << *spec.min_depth << ") must be < max_depth (" << *spec.max_depth << ")";
    SetErr(err, ErrorCode::kInvalidSpec, oss.str());
    return false;
  }
  return true;
}

inline double Edge(double origin, double width, usize k) {
  return origin + static_cast<double>(k) * width;
}

}  // namespace

bool Aggregate(const std::vector<io::DepthRecord>& records,
               const HistogramSpec& spec,
               HistogramResult* out,
               Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "Aggregate: out is null");
    return false;
  }
  if (!ValidateSpec(spec, err)) return false;

  HistogramResult res;
  std::vector<double> kept;
  kept.reserve(records.size());
  for (const auto& r : records) {
    if (spec.min_depth && r.depth < *spec.min_depth) {
      ++res.dropped_below;
      continue;
    }
    if (spec.max_depth && !(r.depth < *spec.max_depth)) {
      ++res.dropped_above;
      continue;
    }
    kept.push_back(r.depth);
  }
  res.total = static_cast<u64>(kept.size());

  if (kept.empty()) {
    *out = std::move(res);
    return true;
  }

  for (double d : kept) {
    if (!std::isfinite(d)) {
      SetErr(err, ErrorCode::kInvalidSpec, "non-finite depth in histogram input");
      return false;
    }
  }
  const auto [lo_it, hi_it] = std::minmax_element(kept.begin(), kept.end());
  const double origin = spec.min_depth ? *spec.min_depth : *lo_it;
  const double w = spec.bin_width;

  // Checked as a double so the index cast below stays in range.
  const double span_bins = (*hi_it - origin) / w;
  if (!std::isfinite(span_bins) || span_bins >= static_cast<double>(kMaxBins)) {
    std::ostringstream oss;
    oss << "depth span [" << origin << ", " << *hi_it << "] needs " << kMaxBins << " or more"
        << " bins of width " << w << "; raise bin_width or set depth clips";
    SetErr(err, ErrorCode::kInvalidSpec, oss.str());
    return false;
  }

  std::vector<usize> index(kept.size());
  usize max_index = 0;
  for (usize i = 0; i < kept.size(); ++i) {
    usize k = static_cast<usize>(std::floor((kept[i] - origin) / w));
    // Floating-point division can land a value on the wrong side of an edge;
    // settle it against the edges the bins will actually report.
    while (k > 0 && kept[i] < Edge(origin, w, k)) --k;
    while (kept[i] >= Edge(origin, w, k + 1)) ++k;
    index[i] = k;
    max_index = std::max(max_index, k);
  }

  res.bins.resize(max_index + 1);
  for (usize k = 0; k <= max_index; ++k) {
    res.bins[k].start = Edge(origin, w, k);
    res.bins[k].end = Edge(origin, w, k + 1);
  }
  if (spec.max_depth && res.bins.back().end > *spec.max_depth) res.bins.back().end = *spec.max_depth;
  for (usize k : index) ++res.bins[k].count;

  u64 sum = 0;
  for (const auto& b : res.bins) sum += b.count;
  IENS_CHECK_EQ(sum, res.total);
  IENS_CHECK_EQ(res.total + res.dropped_below + res.dropped_above, static_cast<u64>(records.size()));

  IENS_LOG_DEBUG("Histogram:", res.bins.size(), "bins, total=", res.total, "dropped_below=", res.dropped_below,
                 "dropped_above=", res.dropped_above);
  *out = std::move(res);
  return true;
}

double MeanPairDistance(const std::vector<io::DepthRecord>& records) {
  const usize n = records.size();
  if (n < 2) return std::numeric_limits<double>::quiet_NaN();
  double sum = 0.0;
  for (usize i = 0; i + 1 < n; ++i) {
    for (usize j = i + 1; j < n; ++j) {
      const double dx = records[i].x - records[j].x;
      const double dy = records[i].y - records[j].y;
      const double dz = records[i].z - records[j].z;
      sum += std::sqrt(dx * dx + dy * dy + dz * dz);
    }
  }
  const double pairs = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
  return sum / pairs;
}

std::vector<SourceSummary> SummarizeSources(const std::vector<io::DepthRecord>& records) {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<io::DepthRecord>> groups;
  for (const auto& r : records) {
    auto it = groups.find(r.source_file);
    if (it == groups.end()) {
      order.push_back(r.source_file);
      it = groups.emplace(r.source_file, std::vector<io::DepthRecord>{}).first;
    }
    it->second.push_back(r);
  }

  std::vector<SourceSummary> out;
  out.reserve(order.size());
  for (const auto& src : order) {
    const auto& group = groups[src];
    SourceSummary s;
    s.source_file = src;
    s.count = static_cast<u64>(group.size());
    OnlineStats st;
    for (const auto& r : group) st.Push(r.depth);
    s.mean_depth = group.empty() ? std::numeric_limits<double>::quiet_NaN() : st.Mean();
    s.mean_pair_distance = MeanPairDistance(group);
    out.push_back(std::move(s));
  }
  return out;
}

Summary SummarizeDepths(const std::vector<io::DepthRecord>& records) {
  std::vector<double> depths;
  depths.reserve(records.size());
  for (const auto& r : records) depths.push_back(r.depth);
  return Summarize(depths);
}

}  // namespace analysis
}  // namespace iens
