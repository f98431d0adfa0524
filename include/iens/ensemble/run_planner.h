#pragma once
// iens/ensemble/run_planner.h
//
// Deterministic derivation of per-run parameters.
//
// Every RunConfig is a pure function of (PlanSpec, run_index): planning run 7
// of a batch of 10 yields exactly what planning run 7 of a batch of 100 yields
// apart from the run_id padding. Nothing depends on how many runs were drawn
// before it.

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/ensemble/run_config.h"

#include <string>
#include <vector>

namespace iens {
namespace ensemble {

struct PlanSpec {
  u64 runs = 10;
  u64 base_seed = 12345;
  Range x_range{-20.0, 20.0};
  Range y_range{-20.0, 20.0};
  Style style = Style::Simple;

  // LoopRandomXY: distance between consecutive run offsets. The y draw uses
  // seed + stride/2 so x and y offsets of all runs stay distinct.
  u64 seed_stride = 1000;
};

// "run_01" for (1, 10), "run_007" for (7, 120). Width is max(2, digits(runs)).
std::string FormatRunId(u64 run_index, u64 runs);

// Plans runs 1..spec.runs.
// kInvalidSpec: runs == 0, min > max on a range, non-finite bounds, stride < 2
// in loop style, or seed offsets that overflow or collide.
bool PlanRuns(const PlanSpec& spec, std::vector<RunConfig>* out, Error* err = nullptr);

// Plans a single run without planning its predecessors.
bool PlanRun(const PlanSpec& spec, u64 run_index, RunConfig* out, Error* err = nullptr);

}  // namespace ensemble
}  // namespace iens
