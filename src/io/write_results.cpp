// src/io/write_results.cpp
//
// Output files of the prepare and analysis tools.

#include "iens/io/write_results.h"

#include "iens/io/csv_io.h"

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace iens {
namespace io {

namespace {

bool FileNonEmpty(const fs::path& p) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return false;
  const auto sz = fs::file_size(p, ec);
  return !ec && sz > 0;
}

bool EnsureParent(const std::string& path, Error* err) {
  return EnsureDirExists(fs::path(path).parent_path().string(), err);
}

std::string Num(double v) {
  if (std::isnan(v)) return "nan";
  std::ostringstream oss;
  oss << std::setprecision(10) << v;
  return oss.str();
}

// csv::Writer reports through std::string; lift it into a coded error.
bool Lift(bool ok, const std::string& msg, const std::string& path, Error* err) {
  if (!ok) SetErr(err, ErrorCode::kIo, path + ": " + (msg.empty() ? std::string("write failed") : msg));
  return ok;
}

}  // namespace

bool EnsureDirExists(const std::string& dir, Error* err) {
  if (dir.empty()) return true;
  std::error_code ec;
  const fs::path p(dir);
  if (fs::exists(p, ec)) {
    if (fs::is_directory(p, ec)) return true;
    SetErr(err, ErrorCode::kIo, "path exists but is not a directory: " + dir);
    return false;
  }
  if (!fs::create_directories(p, ec)) {
    SetErr(err, ErrorCode::kIo, "failed to create directory: " + dir + " (" + ec.message() + ")");
    return false;
  }
  return true;
}

bool WriteHistogramCSV(const std::string& path, const analysis::HistogramResult& hist, Error* err) {
  if (!EnsureParent(path, err)) return false;

  std::string msg;
  csv::Writer w(path, csv::Dialect{}, &msg);
  if (!Lift(w.Ok(), msg, path, err)) return false;
  if (!Lift(w.WriteHeader({"bin_start", "bin_end", "count"}, &msg), msg, path, err)) return false;
  for (const auto& b : hist.bins) {
    if (!Lift(w.WriteRowV(b.start, b.end, b.count), msg, path, err)) return false;
  }
  return Lift(w.Flush(), msg, path, err);
}

bool WriteSourceSummaryTSV(const std::string& path,
                           const std::vector<analysis::SourceSummary>& sources,
                           Error* err) {
  if (!EnsureParent(path, err)) return false;

  csv::Dialect d;
  d.sep = '\t';
  std::string msg;
  csv::Writer w(path, d, &msg);
  if (!Lift(w.Ok(), msg, path, err)) return false;
  if (!Lift(w.WriteHeader({"source_file", "count", "mean_depth", "mean_pair_distance"}, &msg), msg, path, err)) {
    return false;
  }
  for (const auto& s : sources) {
    const std::vector<std::string> row = {s.source_file, std::to_string(s.count), Num(s.mean_depth),
                                          Num(s.mean_pair_distance)};
    if (!Lift(w.WriteRow(row, &msg), msg, path, err)) return false;
  }
  return Lift(w.Flush(), msg, path, err);
}

bool AppendInvocationCSV(const std::string& path, const InvocationRow& row, Error* err) {
  if (!EnsureParent(path, err)) return false;

  const bool need_header = !FileNonEmpty(path);
  std::string msg;
  csv::Writer w(path, csv::Dialect{}, &msg, std::ios::out | std::ios::app);
  if (!Lift(w.Ok(), msg, path, err)) return false;
  if (need_header) {
    if (!Lift(w.WriteHeader({"run_id", "exit_code", "signaled", "signal", "wall_ms", "ok", "command"}, &msg), msg,
              path, err)) {
      return false;
    }
  }
  const std::vector<std::string> cols = {row.run_id,
                                         std::to_string(row.exit_code),
                                         row.signaled ? "1" : "0",
                                         std::to_string(row.signal),
                                         Num(row.wall_ms),
                                         row.ok ? "1" : "0",
                                         row.command};
  if (!Lift(w.WriteRow(cols, &msg), msg, path, err)) return false;
  return Lift(w.Flush(), msg, path, err);
}

}  // namespace io
}  // namespace iens
