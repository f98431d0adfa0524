#pragma once
// iens/ensemble/run_materializer.h
//
// Turns a planned run into a self-contained working directory:
//
//   <out_root>/<run_id>/
//     *.data, *.zbl, *.tersoff*   copied flat from the template directory
//     run_params.txt              identity record (index, seed, positions)
//     in.lmp                      substituted entry document, written LAST
//
// The entry document doubles as the completion marker: a directory without
// it was interrupted and is re-materialized from scratch on the next attempt.
// Nothing outside <out_root>/<run_id> is touched and no run output is deleted.

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/ensemble/run_config.h"
#include "iens/ensemble/run_planner.h"
#include "iens/template/template_store.h"

#include <string>
#include <vector>

namespace iens {
namespace ensemble {

inline constexpr const char* kParamsFileName = "run_params.txt";

struct MaterializeSpec {
  std::string template_dir;
  std::vector<std::string> artifact_patterns = {"*.data", "*.zbl", "*.tersoff*"};
  std::string out_root;
  std::string entry_name = "in.lmp";
  bool write_params = true;
  i32 precision = 6;  // for x_pos/y_pos in run_params.txt
};

struct RunDirectory {
  std::string path;
  std::string entry_input;
  std::string params_file;  // empty when write_params is off
  RunConfig run;
  std::vector<std::string> artifacts;  // file names, sorted
};

// Regular files directly inside template_dir whose names match any pattern.
// Sorted by name; duplicates across patterns are listed once.
bool ListArtifacts(const std::string& template_dir,
                   const std::vector<std::string>& patterns,
                   std::vector<std::string>* names,
                   Error* err = nullptr);

// `doc` is the already-substituted document for `run`.
bool MaterializeRun(const MaterializeSpec& spec,
                    const tmpl::Document& doc,
                    const RunConfig& run,
                    RunDirectory* out,
                    Error* err = nullptr);

bool IsMaterialized(const std::string& run_dir, const std::string& entry_name = "in.lmp");

// Template + plan + materialization for a whole batch. The template is loaded
// and substituted for every run before the first directory is created, so a
// bad template or plan leaves the filesystem untouched.
struct BatchSpec {
  std::string input;  // entry template, relative to template_dir unless absolute
  PlanSpec plan;
  tmpl::SubstitutionSpec subst;
  MaterializeSpec materialize;
};

bool PrepareBatch(const BatchSpec& spec, std::vector<RunDirectory>* out, Error* err = nullptr);

}  // namespace ensemble
}  // namespace iens
