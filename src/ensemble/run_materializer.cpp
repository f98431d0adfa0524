// src/ensemble/run_materializer.cpp

#include "iens/ensemble/run_materializer.h"

#include "iens/core/glob.h"
#include "iens/core/logging.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace iens {
namespace ensemble {

namespace {

std::string ParamsText(const RunConfig& run, i32 precision) {
  std::ostringstream oss;
  oss << "index=" << run.run_index << "\n"
      << "run_id=" << run.run_id << "\n"
      << "style=" << ToString(run.style) << "\n"
      << "seed=" << run.seed << "\n";
  if (run.style == Style::LoopRandomXY) {
    oss << "y_seed=" << run.y_seed << "\n"
        << "x_range=" << tmpl::FormatShortest(run.x_range.min) << "," << tmpl::FormatShortest(run.x_range.max) << "\n"
        << "y_range=" << tmpl::FormatShortest(run.y_range.min) << "," << tmpl::FormatShortest(run.y_range.max) << "\n";
  } else {
    oss << "x_pos=" << tmpl::FormatFixed(run.x_position, precision) << "\n"
        << "y_pos=" << tmpl::FormatFixed(run.y_position, precision) << "\n";
  }
  return oss.str();
}

bool EnsureDir(const fs::path& dir, Error* err) {
  std::error_code ec;
  if (fs::exists(dir, ec)) {
    if (fs::is_directory(dir, ec)) return true;
    SetErr(err, ErrorCode::kIo, "path exists but is not a directory: " + dir.string());
    return false;
  }
  if (!fs::create_directories(dir, ec)) {
    SetErr(err, ErrorCode::kIo, "failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    return false;
  }
  return true;
}

}  // namespace

bool ListArtifacts(const std::string& template_dir,
                   const std::vector<std::string>& patterns,
                   std::vector<std::string>* names,
                   Error* err) {
  if (!names) {
    SetErr(err, ErrorCode::kInvalidSpec, "ListArtifacts: names is null");
    return false;
  }
  names->clear();
  std::error_code ec;
  fs::directory_iterator it(template_dir, ec);
  if (ec) {
    SetErr(err, ErrorCode::kNotFound, "cannot list template directory " + template_dir + " (" + ec.message() + ")");
    return false;
  }
  for (const auto& entry : it) {
    std::error_code fec;
    if (!entry.is_regular_file(fec)) continue;
    const std::string name = entry.path().filename().string();
    for (const auto& pat : patterns) {
      if (MatchWildcard(pat, name)) {
        names->push_back(name);
        break;
      }
    }
  }
  std::sort(names->begin(), names->end());
  return true;
}

bool IsMaterialized(const std::string& run_dir, const std::string& entry_name) {
  std::error_code ec;
  return fs::is_regular_file(fs::path(run_dir) / entry_name, ec);
}

bool MaterializeRun(const MaterializeSpec& spec,
                    const tmpl::Document& doc,
                    const RunConfig& run,
                    RunDirectory* out,
                    Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "MaterializeRun: out is null");
    return false;
  }
  if (spec.out_root.empty() || spec.entry_name.empty() || run.run_id.empty()) {
    SetErr(err, ErrorCode::kInvalidSpec, "MaterializeRun: out_root, entry_name and run_id are required");
    return false;
  }

  const fs::path dir = fs::path(spec.out_root) / run.run_id;
  if (!EnsureDir(dir, err)) return false;

  // Stale marker from an earlier attempt goes first.
  const fs::path entry = dir / spec.entry_name;
  std::error_code ec;
  fs::remove(entry, ec);
  if (ec) {
    SetErr(err, ErrorCode::kIo, "cannot remove stale entry document " + entry.string() + " (" + ec.message() + ")");
    return false;
  }

  RunDirectory rd;
  rd.path = dir.string();
  rd.run = run;

  if (!ListArtifacts(spec.template_dir, spec.artifact_patterns, &rd.artifacts, err)) return false;
  for (const auto& name : rd.artifacts) {
    const fs::path src = fs::path(spec.template_dir) / name;
    const fs::path dst = dir / name;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      SetErr(err, ErrorCode::kIo, "copy " + src.string() + " -> " + dst.string() + " failed (" + ec.message() + ")");
      return false;
    }
  }

  if (spec.write_params) {
    const fs::path params = dir / kParamsFileName;
    tmpl::Document p;
    p.path = params.string();
    p.text = ParamsText(run, spec.precision);
    if (!tmpl::SaveDocument(p.path, p, err)) return false;
    rd.params_file = p.path;
  }

  rd.entry_input = entry.string();
  if (!tmpl::SaveDocument(rd.entry_input, doc, err)) return false;

  IENS_LOG_DEBUG("Materialized", rd.path, "artifacts=", rd.artifacts.size(), "seed=", run.seed);
  *out = std::move(rd);
  return true;
}

bool PrepareBatch(const BatchSpec& spec, std::vector<RunDirectory>* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorCode::kInvalidSpec, "PrepareBatch: out is null");
    return false;
  }
  if (spec.subst.style != spec.plan.style) {
    SetErr(err, ErrorCode::kInvalidSpec,
           "plan style " + std::string(ToString(spec.plan.style)) + " differs from substitution style " +
               std::string(ToString(spec.subst.style)));
    return false;
  }

  tmpl::Document tpl;
  if (!tmpl::LoadTemplate(spec.materialize.template_dir, spec.input, &tpl, err)) return false;

  std::vector<RunConfig> runs;
  if (!PlanRuns(spec.plan, &runs, err)) return false;
  for (const auto& run : runs) IENS_LOG_DEBUG("Planned", run.ToJsonLite());

  // Substitute everything up front: the first failure aborts before any mkdir.
  std::vector<tmpl::Document> docs(runs.size());
  for (usize i = 0; i < runs.size(); ++i) {
    if (!tmpl::Substitute(tpl, spec.subst, runs[i], &docs[i], err)) {
      AddContext(err, runs[i].run_id);
      return false;
    }
  }

  std::vector<std::string> artifacts;
  if (!ListArtifacts(spec.materialize.template_dir, spec.materialize.artifact_patterns, &artifacts, err)) {
    return false;
  }
  if (artifacts.empty()) {
    IENS_LOG_WARN("No artifacts in", spec.materialize.template_dir, "match the copy patterns");
  }

  std::vector<RunDirectory> dirs;
  dirs.reserve(runs.size());
  for (usize i = 0; i < runs.size(); ++i) {
    RunDirectory rd;
    if (!MaterializeRun(spec.materialize, docs[i], runs[i], &rd, err)) {
      AddContext(err, runs[i].run_id);
      return false;
    }
    IENS_LOG_INFO("Prepared:", rd.path, "seed=", runs[i].seed);
    dirs.push_back(std::move(rd));
  }

  *out = std::move(dirs);
  return true;
}

}  // namespace ensemble
}  // namespace iens
