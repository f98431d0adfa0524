#pragma once
// iens/ensemble/process_invoker.h
//
// Runs the simulator once per prepared run directory, sequentially, with the
// run directory as working directory. The simulator is a black box: only its
// exit status is observed. There is no timeout.
//
// Command templates are split like a shell would (single and double quotes,
// backslash escapes outside single quotes) and may reference the run:
//
//   {input}    entry document file name (e.g. in.lmp)
//   {run_id}   run_01, ...
//   {run_dir}  absolute run directory
//   {seed}     the run's seed
//
//   --command="lmp -in {input} -log log.lammps"

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/ensemble/run_materializer.h"

#include <string>
#include <vector>

namespace iens {
namespace ensemble {

// Exit code reported when the program could not be started.
inline constexpr int kExecFailedExitCode = 127;

struct ExitStatus {
  int exit_code = 0;
  bool signaled = false;
  int signal = 0;
  double wall_ms = 0.0;

  bool ok() const noexcept { return !signaled && exit_code == 0; }
};

struct InvokePolicy {
  bool halt_on_failure = false;

  // Appends one row per invocation when non-empty.
  std::string ledger_path;
};

struct RunOutcome {
  std::string run_id;
  ExitStatus status;
  Error error;  // kExternalProcess for non-zero exits
};

struct BatchReport {
  std::vector<RunOutcome> outcomes;
  u64 succeeded = 0;
  u64 failed = 0;
  bool halted = false;
};

// kInvalidSpec on unbalanced quotes or an empty command.
bool SplitCommandLine(const std::string& cmd, std::vector<std::string>* argv, Error* err = nullptr);

std::vector<std::string> ExpandCommand(const std::vector<std::string>& argv, const RunDirectory& run);

// Runs argv[0] (PATH lookup) inside run_dir and waits for it.
// Returns false only when the process could not be created or waited on;
// a non-zero exit is reported through *status.
bool InvokeRun(const std::string& run_dir,
               const std::vector<std::string>& argv,
               ExitStatus* status,
               Error* err = nullptr);

// Runs `command` for every directory in order. Failures are recorded per run;
// with halt_on_failure the batch stops at the first one and returns false
// with kExternalProcess.
bool InvokeBatch(const std::vector<RunDirectory>& runs,
                 const std::string& command,
                 const InvokePolicy& policy,
                 BatchReport* report,
                 Error* err = nullptr);

}  // namespace ensemble
}  // namespace iens
