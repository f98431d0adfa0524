// apps/iens_prepare.cpp
//
// Ensemble preparation:
//   - load the entry template and pick the rewrite style
//   - plan N runs from a base seed
//   - materialize out/run_XX/ with artifacts, run_params.txt and the entry
//   - optionally run the simulator in each directory
//
// Examples:
//   ./iens_prepare --template_dir=templates/N_to_C --input=in.implant.lmp
//                  --out=runs --runs=10 --seed=12345 --x_range=-20,20 --y_range=-20,20
//
//   ./iens_prepare --template_dir=templates/N_to_C --input=in.loop.lmp --out=runs
//                  --style=auto --command="lmp -in {input}" --halt_on_failure

#include "iens/core/config.h"
#include "iens/core/error.h"
#include "iens/core/logging.h"
#include "iens/core/timer.h"
#include "iens/core/types.h"

#include "iens/ensemble/process_invoker.h"
#include "iens/ensemble/run_materializer.h"
#include "iens/ensemble/run_planner.h"
#include "iens/template/template_store.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace iens {
namespace apps {

namespace {

inline bool IsHelpRequested(const ArgMap& args) { return args.Has("help") || args.Has("h"); }

inline int ExitCodeFor(const Error& e) {
  switch (e.code) {
    case ErrorCode::kOk: return 0;
    case ErrorCode::kInvalidSpec: return 2;
    case ErrorCode::kNotFound: return 3;
    case ErrorCode::kSlotNotFound:
    case ErrorCode::kFormat: return 4;
    case ErrorCode::kIo: return 5;
    case ErrorCode::kExternalProcess: return 6;
  }
  return 1;
}

inline void PrintUsage() {
  std::cerr
      << "iens_prepare: build an ensemble of simulation run directories\n\n"
      << "Required:\n"
      << "  --template_dir=<dir>     (template input + *.data/*.zbl/*.tersoff* artifacts)\n"
      << "  --input=<file>           (entry template, relative to template_dir)\n"
      << "  --out=<dir>              (run_XX directories are created here)\n"
      << "\nEnsemble:\n"
      << "  --runs=<N>               (default 10)\n"
      << "  --seed=<base_seed>       (default 12345)\n"
      << "  --x_range=<lo,hi> --y_range=<lo,hi>   (default -20,20)\n"
      << "  --style=<simple|loop_random_xy|auto>  (default simple)\n"
      << "  --seed_stride=<k>        (loop_random_xy offsets; default 1000)\n"
      << "  --copy=<glob,glob,...>   (default *.data,*.zbl,*.tersoff*)\n"
      << "  --var_seed= --var_x= --var_y=       (template variable names)\n"
      << "  --precision=<digits>     (simple-style positions; default 6)\n"
      << "  --entry_name=<file>      (default in.lmp)\n"
      << "\nSimulator (optional):\n"
      << "  --command=\"lmp -in {input}\"         (alias --lammps; {input} {run_id} {run_dir} {seed})\n"
      << "  --halt_on_failure\n"
      << "\nLogging:\n"
      << "  --log_level=<trace|debug|info|warn|error|off> --log_timestamp=0|1 --log_thread=0|1\n";
}

// Resolves --style=auto against the template itself.
bool ResolveStyle(const PrepareConfig& cfg, const tmpl::SubstitutionSpec& subst, Style* out, Error* err) {
  if (cfg.style != Style::Unknown) {
    *out = cfg.style;
    return true;
  }
  tmpl::Document doc;
  if (!tmpl::LoadTemplate(cfg.template_dir, cfg.input, &doc, err)) return false;
  const Style s = tmpl::DetectStyle(doc, subst);
  if (s == Style::Unknown) {
    SetErr(err, ErrorCode::kSlotNotFound,
           doc.path + ": cannot detect style, no `variable " + subst.x_var + " equal ...` line");
    return false;
  }
  IENS_LOG_INFO("Detected template style:", s);
  *out = s;
  return true;
}

}  // namespace

}  // namespace apps
}  // namespace iens

int main(int argc, char** argv) {
  iens::ArgMap args = iens::ArgMap::FromArgv(argc, argv, iens::PrepareConfig::Switches());
  if (iens::apps::IsHelpRequested(args)) {
    iens::apps::PrintUsage();
    return 0;
  }

  iens::PrepareConfig cfg = iens::PrepareConfig::FromArgs(args);

  std::string err;
  if (!cfg.Validate(&err)) {
    IENS_LOG_ERROR("Config validation failed:", err);
    iens::apps::PrintUsage();
    return 2;
  }

  iens::Logger::Instance().SetConfig(cfg.logging);
  for (const auto& kv : cfg.extra) {
    IENS_LOG_WARN("Unknown flag ignored: --" + kv.first + "=" + kv.second);
  }
  for (const auto& pos : args.Positional()) {
    IENS_LOG_WARN("Unexpected positional argument ignored:", pos);
  }
  IENS_LOG_DEBUG("Config:", cfg.ToJsonLite());

  iens::ensemble::BatchSpec batch;
  batch.input = cfg.input;
  batch.subst.seed_var = cfg.var_seed;
  batch.subst.x_var = cfg.var_x;
  batch.subst.y_var = cfg.var_y;
  batch.subst.precision = cfg.precision;

  iens::Error e;
  iens::Style style = iens::Style::Simple;
  if (!iens::apps::ResolveStyle(cfg, batch.subst, &style, &e)) {
    IENS_LOG_ERROR(e);
    return iens::apps::ExitCodeFor(e);
  }
  if (style == iens::Style::LoopRandomXY && cfg.seed_stride < 2) {
    IENS_LOG_ERROR("--seed_stride must be >= 2 for loop_random_xy");
    return 2;
  }
  batch.subst.style = style;

  batch.plan.runs = cfg.runs;
  batch.plan.base_seed = cfg.base_seed;
  batch.plan.x_range = cfg.x_range;
  batch.plan.y_range = cfg.y_range;
  batch.plan.style = style;
  batch.plan.seed_stride = cfg.seed_stride;

  batch.materialize.template_dir = cfg.template_dir;
  batch.materialize.artifact_patterns = cfg.copy_patterns;
  batch.materialize.out_root = cfg.out_root;
  batch.materialize.entry_name = cfg.entry_name;
  batch.materialize.precision = cfg.precision;

  iens::Stopwatch sw;
  std::vector<iens::ensemble::RunDirectory> dirs;
  if (!iens::ensemble::PrepareBatch(batch, &dirs, &e)) {
    IENS_LOG_ERROR("Preparation failed:", e);
    return iens::apps::ExitCodeFor(e);
  }
  IENS_LOG_INFO("Prepared", dirs.size(), "run(s) under", cfg.out_root, "style=", style,
                "ms=", sw.ElapsedMillis());

  if (cfg.command.empty()) {
    IENS_LOG_INFO("No --command given; run directories are ready");
    return 0;
  }

  iens::ensemble::InvokePolicy policy;
  policy.halt_on_failure = cfg.halt_on_failure;
  policy.ledger_path = (fs::path(cfg.out_root) / "invocations.csv").string();

  iens::ensemble::BatchReport report;
  const bool completed = iens::ensemble::InvokeBatch(dirs, cfg.command, policy, &report, &e);
  IENS_LOG_INFO("Simulator runs: ok=", report.succeeded, "failed=", report.failed,
                "ledger=", policy.ledger_path);
  if (!completed) {
    IENS_LOG_ERROR(e);
    return iens::apps::ExitCodeFor(e);
  }
  if (report.failed > 0) {
    for (const auto& oc : report.outcomes) {
      if (!oc.error.ok()) IENS_LOG_WARN("Failed run:", oc.error);
    }
    return 6;
  }
  return 0;
}
