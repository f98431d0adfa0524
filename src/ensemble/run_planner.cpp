// src/ensemble/run_planner.cpp

#include "iens/ensemble/run_planner.h"

#include "iens/core/rng.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace iens {
namespace ensemble {

namespace {

constexpr u64 kMaxU64 = std::numeric_limits<u64>::max();

usize DecimalDigits(u64 v) {
  usize d = 1;
  while (v >= 10) {
    v /= 10;
    ++d;
  }
  return d;
}

bool ValidateSpec(const PlanSpec& spec, Error* err) {
  if (spec.runs == 0) {
    SetErr(err, ErrorCode::kInvalidSpec, "runs must be > 0");
    return false;
  }
  auto check_range = [&](const Range& r, const char* name) {
    if (!std::isfinite(r.min) || !std::isfinite(r.max)) {
      SetErr(err, ErrorCode::kInvalidSpec, std::string(name) + " bounds must be finite");
      return false;
    }
    if (!r.Valid()) {
      std::ostringstream oss;
      oss << name << " " << r << " has min > max";
      SetErr(err, ErrorCode::kInvalidSpec, oss.str());
      return false;
    }
    return true;
  };
  if (!check_range(spec.x_range, "x_range")) return false;
  if (!check_range(spec.y_range, "y_range")) return false;

  if (spec.style == Style::LoopRandomXY) {
    if (spec.seed_stride < 2) {
      SetErr(err, ErrorCode::kInvalidSpec, "seed_stride must be >= 2 for loop_random_xy");
      return false;
    }
    // Largest offset is base + stride*runs + stride/2.
    const u64 half = spec.seed_stride / 2;
    if (spec.base_seed > kMaxU64 - half ||
        spec.runs > (kMaxU64 - spec.base_seed - half) / spec.seed_stride) {
      std::ostringstream oss;
      oss << "seed offsets overflow: seed=" << spec.base_seed << " stride=" << spec.seed_stride
          << " runs=" << spec.runs;
      SetErr(err, ErrorCode::kInvalidSpec, oss.str());
      return false;
    }
  } else if (spec.style == Style::Simple) {
    if (spec.base_seed > kMaxU64 - spec.runs) {
      SetErr(err, ErrorCode::kInvalidSpec, "seed + runs overflows a 64-bit seed");
      return false;
    }
  } else {
    SetErr(err, ErrorCode::kInvalidSpec, "plan style must be simple or loop_random_xy");
    return false;
  }
  return true;
}

void FillRun(const PlanSpec& spec, u64 run_index, RunConfig* out) {
  RunConfig rc;
  rc.run_index = run_index;
  rc.run_id = FormatRunId(run_index, spec.runs);
  rc.style = spec.style;
  rc.x_range = spec.x_range;
  rc.y_range = spec.y_range;

  if (spec.style == Style::LoopRandomXY) {
    rc.seed = spec.base_seed + spec.seed_stride * run_index;
    rc.y_seed = rc.seed + spec.seed_stride / 2;
  } else {
    rc.seed = spec.base_seed + run_index;
    Rng rng(DeriveSeed(spec.base_seed, run_index));
    rc.x_position = rng.UniformDouble(spec.x_range.min, spec.x_range.max);
    rc.y_position = rng.UniformDouble(spec.y_range.min, spec.y_range.max);
  }
  *out = std::move(rc);
}

}  // namespace

std::string FormatRunId(u64 run_index, u64 runs) {
  const usize width = std::max<usize>(2, DecimalDigits(runs));
  std::string digits = std::to_string(run_index);
  if (digits.size() < width) digits.insert(0, width - digits.size(), '0');
  return "run_" + digits;
}

bool PlanRun(const PlanSpec& spec, u64 run_index, RunConfig* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "PlanRun: out is null");
    return false;
  }
  if (!ValidateSpec(spec, err)) return false;
  if (run_index == 0 || run_index > spec.runs) {
    SetErr(err, ErrorCode::kInvalidSpec,
           "run_index " + std::to_string(run_index) + " outside 1.." + std::to_string(spec.runs));
    return false;
  }
  FillRun(spec, run_index, out);
  return true;
}

bool PlanRuns(const PlanSpec& spec, std::vector<RunConfig>* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "PlanRuns: out is null");
    return false;
  }
  if (!ValidateSpec(spec, err)) return false;

  std::vector<RunConfig> runs(static_cast<usize>(spec.runs));
  for (u64 i = 1; i <= spec.runs; ++i) FillRun(spec, i, &runs[static_cast<usize>(i - 1)]);

  if (spec.style == Style::LoopRandomXY) {
    std::unordered_set<u64> offsets;
    offsets.reserve(runs.size() * 2);
    for (const RunConfig& rc : runs) {
      for (const u64 off : {rc.seed, rc.y_seed}) {
        if (!offsets.insert(off).second) {
          SetErr(err, ErrorCode::kInvalidSpec,
                 "seed offset " + std::to_string(off) + " repeats (" + rc.run_id + ")");
          return false;
        }
      }
    }
  }

  *out = std::move(runs);
  return true;
}

}  // namespace ensemble
}  // namespace iens
