#pragma once
// iens/ensemble/run_config.h
//
// One planned run of an ensemble. Produced by PlanRuns(), read by the template
// engine and the materializer, never modified after planning.

#include "iens/core/types.h"

#include <sstream>
#include <string>

namespace iens {
namespace ensemble {

struct RunConfig {
  // 1-based ordinal, contiguous within a batch.
  u64 run_index = 0;

  // "run_01", "run_002", ...: zero-padded to the width of the batch size.
  std::string run_id;

  Style style = Style::Simple;

  // Simple: value assigned to the seed variable.
  // LoopRandomXY: additive offset embedded in the x draw.
  u64 seed = 0;

  // LoopRandomXY only: additive offset embedded in the y draw.
  u64 y_seed = 0;

  // Simple style: the drawn injection position.
  double x_position = 0.0;
  double y_position = 0.0;

  // LoopRandomXY: bounds embedded verbatim for in-simulator draws.
  Range x_range;
  Range y_range;

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss.precision(17);
    oss << "{"
        << "\"run_index\":" << run_index << ","
        << "\"run_id\":\"" << run_id << "\","
        << "\"style\":\"" << ToString(style) << "\","
        << "\"seed\":" << seed << ",";
    if (style == Style::LoopRandomXY) {
      oss << "\"y_seed\":" << y_seed << ","
          << "\"x_range\":[" << x_range.min << "," << x_range.max << "],"
          << "\"y_range\":[" << y_range.min << "," << y_range.max << "]";
    } else {
      oss << "\"x_pos\":" << x_position << ","
          << "\"y_pos\":" << y_position;
    }
    oss << "}";
    return oss.str();
  }

  friend bool operator==(const RunConfig& a, const RunConfig& b) {
    return a.run_index == b.run_index && a.run_id == b.run_id && a.style == b.style &&
           a.seed == b.seed && a.y_seed == b.y_seed && a.x_position == b.x_position &&
           a.y_position == b.y_position && a.x_range == b.x_range && a.y_range == b.y_range;
  }
  friend bool operator!=(const RunConfig& a, const RunConfig& b) { return !(a == b); }
};

}  // namespace ensemble
}  // namespace iens
