#pragma once
// iens/io/write_results.h
//
// Writers for the tool outputs. The schemas are fixed so downstream plotting
// scripts can rely on them:
//
//   histogram CSV       bin_start,bin_end,count
//   source summary TSV  source_file  count  mean_depth  mean_pair_distance
//   invocation ledger   run_id,exit_code,signaled,signal,wall_ms,ok,command
//                       (appended; header written once)

#include "iens/analysis/histogram.h"
#include "iens/core/error.h"
#include "iens/core/types.h"

#include <string>
#include <vector>

namespace iens {
namespace io {

// Creates `dir` (and parents) unless it already is a directory.
bool EnsureDirExists(const std::string& dir, Error* err = nullptr);

bool WriteHistogramCSV(const std::string& path,
                       const analysis::HistogramResult& hist,
                       Error* err = nullptr);

// NaN figures are written as "nan".
bool WriteSourceSummaryTSV(const std::string& path,
                           const std::vector<analysis::SourceSummary>& sources,
                           Error* err = nullptr);

struct InvocationRow {
  std::string run_id;
  int exit_code = 0;
  bool signaled = false;
  int signal = 0;
  double wall_ms = 0.0;
  bool ok = false;
  std::string command;
};

bool AppendInvocationCSV(const std::string& path, const InvocationRow& row, Error* err = nullptr);

}  // namespace io
}  // namespace iens
