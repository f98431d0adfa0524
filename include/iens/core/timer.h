#pragma once
// iens/core/timer.h
//
// Wall-clock stopwatch (steady_clock) for timing simulator invocations.

#include "iens/core/types.h"

#include <chrono>

namespace iens {

class Stopwatch {
 public:
  using Clock = std::chrono::steady_clock;

  Stopwatch() : start_(Clock::now()) {}

  u64 ElapsedNanos() const {
    return static_cast<u64>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_).count());
  }

  double ElapsedMillis() const { return static_cast<double>(ElapsedNanos()) / 1e6; }

 private:
  Clock::time_point start_;
};

}  // namespace iens
