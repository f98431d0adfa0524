// tests/test_result_locator.cpp
//
// Result file resolution:
//  - wildcards in directory components
//  - directories resolve to the first default name inside
//  - de-duplication across overlapping patterns, first-seen order
//  - zero-match patterns reported per pattern

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/io/result_locator.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
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
using iens::io::LocateOptions;
using iens::io::LocateReport;

void Touch(const fs::path& p) {
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  out << "1 2 3\n";
}

std::string Name(const std::string& path) {
  const fs::path p(path);
  return p.parent_path().filename().string() + "/" + p.filename().string();
}

void TestLocate(TestContext& t, const fs::path& root) {
  Touch(root / "runs" / "run_01" / "N_list");
  Touch(root / "runs" / "run_02" / "N_list.txt");
  Touch(root / "runs" / "run_03" / "vacancy_list.xyz");
  Touch(root / "runs" / "run_03" / "N_list.xyz");
  fs::create_directories(root / "runs" / "run_04");  // nothing inside
  Touch(root / "runs" / "notes" / "N_list");
  Touch(root / "other" / "deep" / "x" / "N_list");

  const std::string runs = (root / "runs").string();

  LocateReport rep;
  Error e;
  CHECK(t, iens::io::LocateResults({runs + "/run_*"}, LocateOptions{}, &rep, &e));
  CHECK_EQ(t, rep.files.size(), static_cast<std::size_t>(3));
  if (rep.files.size() == 3) {
    CHECK_EQ(t, Name(rep.files[0]), std::string("run_01/N_list"));
    CHECK_EQ(t, Name(rep.files[1]), std::string("run_02/N_list.txt"));
    CHECK_EQ(t, Name(rep.files[2]), std::string("run_03/N_list.xyz"));
  }
  CHECK(t, rep.AllMatched());

  // Wildcard in a directory component with an explicit file name.
  CHECK(t, iens::io::LocateResults({runs + "/run_*/N_list"}, LocateOptions{}, &rep, &e));
  CHECK_EQ(t, rep.files.size(), static_cast<std::size_t>(1));

  // Overlap: same file through a literal path and a pattern is listed once.
  CHECK(t, iens::io::LocateResults({runs + "/run_02", runs + "/run_0[1-2]", runs + "/../runs/run_01/N_list"},
                                   LocateOptions{}, &rep, &e));
  CHECK_EQ(t, rep.files.size(), static_cast<std::size_t>(2));
  if (rep.files.size() == 2) {
    CHECK_EQ(t, Name(rep.files[0]), std::string("run_02/N_list.txt"));
    CHECK_EQ(t, Name(rep.files[1]), std::string("run_01/N_list"));
  }
  CHECK_EQ(t, rep.per_pattern.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, rep.per_pattern[1].matched_count, static_cast<iens::u64>(2));

  // Zero matches are reported, not errors.
  CHECK(t, iens::io::LocateResults({runs + "/run_9*", runs + "/run_01"}, LocateOptions{}, &rep, &e));
  CHECK(t, !rep.AllMatched());
  CHECK_EQ(t, rep.per_pattern[0].matched_count, static_cast<iens::u64>(0));
  CHECK_EQ(t, rep.files.size(), static_cast<std::size_t>(1));

  // Custom default names.
  LocateOptions vac;
  vac.default_names = {"vacancy_list.xyz"};
  CHECK(t, iens::io::LocateResults({runs + "/run_*"}, vac, &rep, &e));
  CHECK_EQ(t, rep.files.size(), static_cast<std::size_t>(1));

  // Recursive component.
  CHECK(t, iens::io::LocateResults({(root / "other").string() + "/**/N_list"}, LocateOptions{}, &rep, &e));
  CHECK_EQ(t, rep.files.size(), static_cast<std::size_t>(1));

  Error bad;
  CHECK(t, !iens::io::LocateResults({}, LocateOptions{}, &rep, &bad));
  CHECK(t, bad.code == ErrorCode::kInvalidSpec);
}

}  // namespace

int main() {
  TestContext t;

  const fs::path tmp_root = fs::temp_directory_path() / "iens_result_locator_test";
  std::error_code ec;
  fs::remove_all(tmp_root, ec);
  fs::create_directories(tmp_root);

  TestLocate(t, tmp_root);

  fs::remove_all(tmp_root, ec);

  if (t.fails == 0) {
    std::cout << "[OK] test_result_locator\n";
    return 0;
  }
  std::cerr << "[FAILED] test_result_locator: " << t.fails << " failure(s)\n";
  return 1;
}
