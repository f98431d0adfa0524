// tests/test_write_results.cpp
//
// Regression tests for write_results utilities.

#include "iens/analysis/histogram.h"
#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/io/write_results.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)

std::string ReadFile(const fs::path& p) {
  std::ifstream in(p);
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

}  // namespace

int main() {
  TestContext t;

  const fs::path tmp_root = fs::temp_directory_path() / "iens_write_results_test";
  std::error_code ec;
  fs::remove_all(tmp_root, ec);
  fs::create_directories(tmp_root);

  // Histogram table, parent directories created on demand.
  iens::analysis::HistogramResult hist;
  hist.bins = {{0.0, 5.0, 3}, {5.0, 10.0, 0}, {10.0, 12.5, 1}};
  hist.total = 4;
  const fs::path csv_path = tmp_root / "out" / "depth_hist.csv";
  iens::Error e;
  CHECK(t, iens::io::WriteHistogramCSV(csv_path.string(), hist, &e));
  CHECK(t, ReadFile(csv_path) == "bin_start,bin_end,count\n0,5,3\n5,10,0\n10,12.5,1\n");

  // Per-source table: NaN shows up as "nan".
  std::vector<iens::analysis::SourceSummary> sources(2);
  sources[0].source_file = "runs/run_01/N_list";
  sources[0].count = 2;
  sources[0].mean_depth = 15.0;
  sources[0].mean_pair_distance = 10.0;
  sources[1].source_file = "runs/run_02/N_list";
  sources[1].count = 1;
  sources[1].mean_depth = 5.0;
  sources[1].mean_pair_distance = std::numeric_limits<double>::quiet_NaN();
  const fs::path tsv_path = tmp_root / "sources.tsv";
  CHECK(t, iens::io::WriteSourceSummaryTSV(tsv_path.string(), sources, &e));
  const std::string tsv = ReadFile(tsv_path);
  CHECK(t, tsv.find("source_file\tcount\tmean_depth\tmean_pair_distance\n") == 0);
  CHECK(t, tsv.find("runs/run_01/N_list\t2\t15\t10\n") != std::string::npos);
  CHECK(t, tsv.find("runs/run_02/N_list\t1\t5\tnan\n") != std::string::npos);

  // Ledger: header once, rows appended, commands with commas quoted.
  const fs::path ledger = tmp_root / "invocations.csv";
  iens::io::InvocationRow row;
  row.run_id = "run_01";
  row.ok = true;
  row.command = "lmp -in in.lmp";
  CHECK(t, iens::io::AppendInvocationCSV(ledger.string(), row, &e));
  row.run_id = "run_02";
  row.exit_code = 1;
  row.ok = false;
  row.command = "lmp -var xy 1,2";
  CHECK(t, iens::io::AppendInvocationCSV(ledger.string(), row, &e));
  const std::string led = ReadFile(ledger);
  CHECK(t, led.find("run_id,exit_code,signaled,signal,wall_ms,ok,command\n") == 0);
  CHECK(t, led.find("run_id,exit_code", 1) == std::string::npos);
  CHECK(t, led.find("run_01,0,0,0,0,1,lmp -in in.lmp\n") != std::string::npos);
  CHECK(t, led.find("run_02,1,0,0,0,0,\"lmp -var xy 1,2\"\n") != std::string::npos);

  // Create a file that will be (incorrectly) treated as a directory path.
  const fs::path blocker = tmp_root / "blocker.txt";
  {
    std::ofstream f(blocker.string());
    f << "x";
  }
  const fs::path target = blocker / "hist.csv";
  iens::Error blocked;
  CHECK(t, !iens::io::WriteHistogramCSV(target.string(), hist, &blocked));
  CHECK(t, blocked.code == iens::ErrorCode::kIo);
  CHECK(t, blocked.message.find("not a directory") != std::string::npos);
  CHECK(t, !fs::exists(target));

  fs::remove_all(tmp_root, ec);

  if (t.fails == 0) {
    std::cout << "[OK] test_write_results\n";
    return 0;
  }
  std::cerr << "[FAILED] test_write_results: " << t.fails << " failure(s)\n";
  return 1;
}
