// tests/test_record_parser.cpp
//
// Result file parsing:
//  - format sniffing by content
//  - defect lists: OVITO header, XYZ, bare rows, malformed rows counted
//  - trajectories: last frame only, scaled coordinates, type filter
//  - schema errors and missing surface_z

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/io/record_parser.h"

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
using iens::u64;
using iens::io::DepthRecord;
using iens::io::ParseOptions;
using iens::io::ParseStats;
using iens::io::RecordFormat;

ParseOptions Opts(double surface_z = 125.0) {
  ParseOptions o;
  o.surface_z = surface_z;
  return o;
}

void TestSniff(TestContext& t) {
  CHECK(t, iens::io::SniffFormat("\n\n  ITEM: TIMESTEP\n0\n") == RecordFormat::Trajectory);
  CHECK(t, iens::io::SniffFormat("# Position.X Position.Y Position.Z\n") == RecordFormat::DefectList);
  CHECK(t, iens::io::SniffFormat("1 2 3\n") == RecordFormat::DefectList);
  CHECK(t, iens::io::SniffFormat(" \n\t\n") == RecordFormat::Empty);
}

void TestBareRowsWithMalformedTail(TestContext& t) {
  const std::string text =
      "N 0.0 0.0 120.0\n"
      "N 1.0 0.0 110.0\n"
      "N 0.0 1.0 100.0\n"
      "N 2.0 2.0 95.5\n"
      "N 3.0 0.0 130.0\n"
      "N 3.0 0.0\n";
  std::vector<DepthRecord> recs;
  ParseStats st;
  Error e;
  CHECK(t, iens::io::ParseText(text, "N_list", Opts(), &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(5));
  CHECK_EQ(t, st.skipped_lines, static_cast<u64>(1));
  CHECK_EQ(t, st.records, static_cast<u64>(5));
  CHECK_EQ(t, st.format, std::string("defect_list"));
  if (recs.size() == 5) {
    CHECK_NEAR(t, recs[0].depth, 5.0, 1e-12);
    CHECK_NEAR(t, recs[3].depth, 29.5, 1e-12);
    CHECK_NEAR(t, recs[4].depth, -5.0, 1e-12);  // above the surface, kept
    CHECK_EQ(t, recs[0].species_type, std::string("N"));
    CHECK_EQ(t, recs[0].source_file, std::string("N_list"));
  }

  // Records append to what is already there.
  CHECK(t, iens::io::ParseText("1 2 3\n", "b", Opts(), &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(6));

  ParseOptions no_neg = Opts();
  no_neg.skip_negative = true;
  std::vector<DepthRecord> kept;
  CHECK(t, iens::io::ParseText(text, "N_list", no_neg, &kept, &st, &e));
  CHECK_EQ(t, kept.size(), static_cast<std::size_t>(4));
  CHECK_EQ(t, st.dropped_negative, static_cast<u64>(1));
}

void TestOvitoAndXyz(TestContext& t) {
  const std::string ovito =
      "# Exported by OVITO\n"
      "# \"Particle Identifier\" \"Particle Type\" \"Position.X\" \"Position.Y\" \"Position.Z\"\n"
      "1 N 0.5 0.5 100.0\n"
      "2 C 0.5 0.5 90.0\n"
      "3 N 1.5 0.5 80.0\n"
      "4 N 1.5 nan? 80.0\n";
  std::vector<DepthRecord> recs;
  ParseStats st;
  Error e;
  CHECK(t, iens::io::ParseText(ovito, "ovito.txt", Opts(), &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, st.skipped_lines, static_cast<u64>(1));

  ParseOptions only_n = Opts();
  only_n.type_filter = std::string("N");
  recs.clear();
  CHECK(t, iens::io::ParseText(ovito, "ovito.txt", only_n, &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(2));
  CHECK_EQ(t, st.filtered_by_type, static_cast<u64>(1));

  // No tag column: the filter has nothing to match and is not applied.
  const std::string untagged =
      "# \"Position.X\" \"Position.Y\" \"Position.Z\"\n"
      "0.5 0.5 100.0\n"
      "1.5 0.5 80.0\n";
  recs.clear();
  CHECK(t, iens::io::ParseText(untagged, "untagged.txt", only_n, &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(2));
  CHECK_EQ(t, st.filtered_by_type, static_cast<u64>(0));
  if (!recs.empty()) CHECK(t, recs[0].species_type.empty());

  const std::string xyz =
      "3\n"
      "Lattice=\"...\" Properties=species:S:1:pos:R:3\n"
      "N 0.0 0.0 100.0\n"
      "N 1.0 0.0 105.0\n"
      "N 2.0 0.0 110.0\n";
  recs.clear();
  CHECK(t, iens::io::ParseText(xyz, "N_list.xyz", Opts(), &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, st.skipped_lines, static_cast<u64>(0));
  if (recs.size() == 3) CHECK_NEAR(t, recs[2].depth, 15.0, 1e-12);
}

const char* kDump =
    "ITEM: TIMESTEP\n"
    "0\n"
    "ITEM: NUMBER OF ATOMS\n"
    "2\n"
    "ITEM: BOX BOUNDS pp pp pp\n"
    "0 10\n"
    "0 10\n"
    "0 200\n"
    "ITEM: ATOMS id type x y z\n"
    "1 1 1.0 1.0 150.0\n"
    "2 3 2.0 2.0 140.0\n"
    "ITEM: TIMESTEP\n"
    "1000\n"
    "ITEM: NUMBER OF ATOMS\n"
    "4\n"
    "ITEM: BOX BOUNDS pp pp pp\n"
    "0 10\n"
    "0 10\n"
    "0 200\n"
    "ITEM: ATOMS id type xs ys zs\n"
    "1 1 0.1 0.1 0.5\n"
    "2 3 0.2 0.2 0.55\n"
    "3 3.0 0.3 0.3 0.6\n"
    "4 3 0.4 0.4\n";

void TestTypeFilterValues(TestContext& t) {
  const std::string typed =
      "# \"Particle Type\" \"Position.X\" \"Position.Y\" \"Position.Z\"\n"
      "3 0 0 100\n"
      "3.0 0 0 100\n"
      "3.7 0 0 100\n"
      "1e30 0 0 100\n"
      "N 0 0 100\n";
  std::vector<DepthRecord> recs;
  ParseStats st;
  Error e;

  ParseOptions three = Opts();
  three.type_filter = std::string("3");
  CHECK(t, iens::io::ParseText(typed, "typed.txt", three, &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(2));  // "3" and "3.0", not "3.7"
  CHECK_EQ(t, st.filtered_by_type, static_cast<u64>(3));

  // Out of integer range: only the exact text matches.
  ParseOptions huge = Opts();
  huge.type_filter = std::string("1e30");
  recs.clear();
  CHECK(t, iens::io::ParseText(typed, "typed.txt", huge, &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(1));
  if (recs.size() == 1) CHECK_EQ(t, recs[0].species_type, std::string("1e30"));

  ParseOptions huge_alt = Opts();
  huge_alt.type_filter = std::string("1.0e30");
  recs.clear();
  CHECK(t, iens::io::ParseText(typed, "typed.txt", huge_alt, &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(0));
}

void TestTrajectory(TestContext& t) {
  std::vector<DepthRecord> recs;
  ParseStats st;
  Error e;
  CHECK(t, iens::io::ParseText(kDump, "dump.final", Opts(), &recs, &st, &e));
  CHECK_EQ(t, st.format, std::string("trajectory"));
  CHECK_EQ(t, st.frames, static_cast<u64>(2));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(3));  // last frame only
  CHECK_EQ(t, st.skipped_lines, static_cast<u64>(1));
  if (recs.size() == 3) {
    // zs=0.5 in [0,200] -> z=100 -> depth 25.
    CHECK_NEAR(t, recs[0].z, 100.0, 1e-12);
    CHECK_NEAR(t, recs[0].depth, 25.0, 1e-12);
    CHECK_NEAR(t, recs[1].x, 2.0, 1e-12);
    CHECK_NEAR(t, recs[2].depth, 5.0, 1e-12);
  }

  ParseOptions type3 = Opts();
  type3.type_filter = std::string("3");
  recs.clear();
  CHECK(t, iens::io::ParseText(kDump, "dump.final", type3, &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(2));  // "3" and "3.0"
  CHECK_EQ(t, st.filtered_by_type, static_cast<u64>(1));

  // Filter requested but no type column.
  const std::string no_type =
      "ITEM: TIMESTEP\n0\nITEM: NUMBER OF ATOMS\n1\nITEM: ATOMS id x y z\n1 0 0 100\n";
  Error fmt;
  CHECK(t, !iens::io::ParseText(no_type, "dump.notype", type3, &recs, &st, &fmt));
  CHECK(t, fmt.code == ErrorCode::kFormat);
  CHECK(t, fmt.message.find("dump.notype") != std::string::npos);

  Error nocoord;
  CHECK(t, !iens::io::ParseText("ITEM: ATOMS id type vx vy vz\n1 1 0 0 0\n", "dump.v", Opts(), &recs, &st,
                                &nocoord));
  CHECK(t, nocoord.code == ErrorCode::kFormat);

  // Unwrapped coordinates are taken as absolute.
  recs.clear();
  CHECK(t, iens::io::ParseText("ITEM: ATOMS id xu yu zu\n1 0 0 -5\n", "dump.u", Opts(100.0), &recs, &st, &e));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(1));
  if (!recs.empty()) CHECK_NEAR(t, recs[0].depth, 105.0, 1e-12);
}

void TestFilesAndSpec(TestContext& t, const fs::path& root) {
  fs::create_directories(root);
  const fs::path dump = root / "N_list";  // content decides, not the name
  {
    std::ofstream out(dump);
    out << kDump;
  }
  std::vector<DepthRecord> recs;
  ParseStats st;
  Error e;
  CHECK(t, iens::io::ParseRecords(dump.string(), Opts(), &recs, &st, &e));
  CHECK_EQ(t, st.format, std::string("trajectory"));
  CHECK_EQ(t, recs.size(), static_cast<std::size_t>(3));
  if (!recs.empty()) CHECK_EQ(t, recs[0].source_file, dump.string());

  Error nf;
  CHECK(t, !iens::io::ParseRecords((root / "missing").string(), Opts(), &recs, &st, &nf));
  CHECK(t, nf.code == ErrorCode::kNotFound);

  Error spec;
  CHECK(t, !iens::io::ParseRecords(dump.string(), ParseOptions{}, &recs, &st, &spec));
  CHECK(t, spec.code == ErrorCode::kInvalidSpec);
}

}  // namespace

int main() {
  TestContext t;

  const fs::path tmp_root = fs::temp_directory_path() / "iens_record_parser_test";
  std::error_code ec;
  fs::remove_all(tmp_root, ec);

  TestSniff(t);
  TestBareRowsWithMalformedTail(t);
  TestOvitoAndXyz(t);
  TestTypeFilterValues(t);
  TestTrajectory(t);
  TestFilesAndSpec(t, tmp_root);

  fs::remove_all(tmp_root, ec);

  if (t.fails == 0) {
    std::cout << "[OK] test_record_parser\n";
    return 0;
  }
  std::cerr << "[FAILED] test_record_parser: " << t.fails << " failure(s)\n";
  return 1;
}
