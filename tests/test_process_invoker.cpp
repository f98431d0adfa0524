// tests/test_process_invoker.cpp
//
// Simulator invocation:
//  - shell-like command splitting and placeholder expansion
//  - exit codes, working directory, exec failure
//  - batch continues or halts per policy; ledger rows appended

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/ensemble/process_invoker.h"
#include "iens/ensemble/run_materializer.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
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

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb, const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }

  void CheckNear(double a, double b, double rel_eps, const char* ea, const char* eb,
                 const char* file, int line) {
    const double diff = std::fabs(a - b);
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    if (diff <= rel_eps * scale) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line
              << "  CHECK_NEAR(" << ea << ", " << eb << ")  got " << a << " vs " << b
              << "  diff=" << diff << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NEAR(ctx, a, b, eps) (ctx).CheckNear((a), (b), (eps), #a, #b, __FILE__, __LINE__)

using iens::Error;
using iens::ErrorCode;
using iens::usize;
using iens::ensemble::RunDirectory;

RunDirectory MakeRun(const fs::path& root, const std::string& id, iens::u64 seed) {
  RunDirectory rd;
  rd.path = (root / id).string();
  rd.entry_input = (root / id / "in.lmp").string();
  rd.run.run_id = id;
  rd.run.seed = seed;
  fs::create_directories(rd.path);
  return rd;
}

usize CountLines(const fs::path& p) {
  std::ifstream in(p);
  std::string line;
  usize n = 0;
  while (std::getline(in, line)) ++n;
  return n;
}

void TestSplit(TestContext& t) {
  std::vector<std::string> argv;
  Error e;
  CHECK(t, iens::ensemble::SplitCommandLine("lmp -in {input}  -log 'my log.txt'", &argv, &e));
  const std::vector<std::string> want = {"lmp", "-in", "{input}", "-log", "my log.txt"};
  CHECK(t, argv == want);

  CHECK(t, iens::ensemble::SplitCommandLine("sh -c \"echo \\\"hi\\\" > out.txt\"", &argv, &e));
  CHECK_EQ(t, argv.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, argv[2], std::string("echo \"hi\" > out.txt"));

  CHECK(t, iens::ensemble::SplitCommandLine("a ''", &argv, &e));
  CHECK_EQ(t, argv.size(), static_cast<std::size_t>(2));
  CHECK_EQ(t, argv[1], std::string());

  Error unbalanced;
  CHECK(t, !iens::ensemble::SplitCommandLine("lmp -in 'oops", &argv, &unbalanced));
  CHECK(t, unbalanced.code == ErrorCode::kInvalidSpec);

  Error empty;
  CHECK(t, !iens::ensemble::SplitCommandLine("   ", &argv, &empty));
  CHECK(t, empty.code == ErrorCode::kInvalidSpec);
}

void TestExpand(TestContext& t, const fs::path& root) {
  const RunDirectory rd = MakeRun(root, "run_04", 12349);
  const std::vector<std::string> argv = {"lmp", "-in", "{input}", "-var", "tag", "{run_id}_{seed}", "{run_dir}"};
  const auto out = iens::ensemble::ExpandCommand(argv, rd);
  CHECK_EQ(t, out[2], std::string("in.lmp"));
  CHECK_EQ(t, out[5], std::string("run_04_12349"));
  CHECK(t, fs::path(out[6]).is_absolute());
  CHECK_EQ(t, fs::path(out[6]).filename().string(), std::string("run_04"));
}

void TestInvokeRun(TestContext& t, const fs::path& root) {
  const RunDirectory rd = MakeRun(root, "run_01", 1);

  iens::ensemble::ExitStatus st;
  Error e;
  CHECK(t, iens::ensemble::InvokeRun(rd.path, {"/bin/sh", "-c", "exit 3"}, &st, &e));
  CHECK_EQ(t, st.exit_code, 3);
  CHECK(t, !st.signaled);
  CHECK(t, !st.ok());
  CHECK(t, st.wall_ms >= 0.0);

  // Working directory is the run directory.
  CHECK(t, iens::ensemble::InvokeRun(rd.path, {"/bin/sh", "-c", "echo done > marker.txt"}, &st, &e));
  CHECK(t, st.ok());
  CHECK(t, fs::exists(fs::path(rd.path) / "marker.txt"));

  CHECK(t, iens::ensemble::InvokeRun(rd.path, {"/bin/sh", "-c", "kill -9 $$"}, &st, &e));
  CHECK(t, st.signaled);
  CHECK_EQ(t, st.signal, 9);

  CHECK(t, iens::ensemble::InvokeRun(rd.path, {"iens-definitely-not-a-program"}, &st, &e));
  CHECK_EQ(t, st.exit_code, iens::ensemble::kExecFailedExitCode);
}

void TestBatch(TestContext& t, const fs::path& root) {
  std::vector<RunDirectory> runs = {MakeRun(root, "run_01", 11), MakeRun(root, "run_02", 12),
                                    MakeRun(root, "run_03", 13)};
  // run_02 fails.
  const std::string cmd = "/bin/sh -c 'test {run_id} != run_02 && echo {seed} > ran.txt'";

  iens::ensemble::InvokePolicy keep_going;
  keep_going.ledger_path = (root / "invocations.csv").string();
  iens::ensemble::BatchReport rep;
  Error e;
  CHECK(t, iens::ensemble::InvokeBatch(runs, cmd, keep_going, &rep, &e));
  CHECK_EQ(t, rep.outcomes.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, rep.succeeded, static_cast<iens::u64>(2));
  CHECK_EQ(t, rep.failed, static_cast<iens::u64>(1));
  CHECK(t, !rep.halted);
  CHECK(t, rep.outcomes[1].error.code == ErrorCode::kExternalProcess);
  CHECK(t, rep.outcomes[1].error.message.find("run_02") != std::string::npos);
  CHECK(t, fs::exists(root / "run_03" / "ran.txt"));
  CHECK(t, !fs::exists(root / "run_02" / "ran.txt"));
  CHECK_EQ(t, CountLines(root / "invocations.csv"), static_cast<usize>(4));  // header + 3

  for (const auto& r : runs) fs::remove(fs::path(r.path) / "ran.txt");

  iens::ensemble::InvokePolicy halt;
  halt.halt_on_failure = true;
  halt.ledger_path = keep_going.ledger_path;
  Error herr;
  CHECK(t, !iens::ensemble::InvokeBatch(runs, cmd, halt, &rep, &herr));
  CHECK(t, herr.code == ErrorCode::kExternalProcess);
  CHECK(t, rep.halted);
  CHECK_EQ(t, rep.outcomes.size(), static_cast<std::size_t>(2));
  CHECK(t, !fs::exists(root / "run_03" / "ran.txt"));
  CHECK_EQ(t, CountLines(root / "invocations.csv"), static_cast<usize>(6));
}

}  // namespace

int main() {
  TestContext t;

  const fs::path tmp_root = fs::temp_directory_path() / "iens_process_invoker_test";
  std::error_code ec;
  fs::remove_all(tmp_root, ec);
  fs::create_directories(tmp_root);

  TestSplit(t);
  TestExpand(t, tmp_root / "expand");
  TestInvokeRun(t, tmp_root / "single");
  TestBatch(t, tmp_root / "batch");

  fs::remove_all(tmp_root, ec);

  if (t.fails == 0) {
    std::cout << "[OK] test_process_invoker\n";
    return 0;
  }
  std::cerr << "[FAILED] test_process_invoker: " << t.fails << " failure(s)\n";
  return 1;
}
