// src/ensemble/process_invoker.cpp

#include "iens/ensemble/process_invoker.h"

#include "iens/core/logging.h"
#include "iens/core/timer.h"
#include "iens/io/write_results.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace iens {
namespace ensemble {

namespace {

void ReplaceAll(std::string* s, const std::string& from, const std::string& to) {
  usize pos = 0;
  while ((pos = s->find(from, pos)) != std::string::npos) {
    s->replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string JoinArgs(const std::vector<std::string>& argv) {
  std::string out;
  for (usize i = 0; i < argv.size(); ++i) {
    if (i) out.push_back(' ');
    out += argv[i];
  }
  return out;
}

}  // namespace

bool SplitCommandLine(const std::string& cmd, std::vector<std::string>* argv, Error* err) {
  if (!argv) {
    SetErr(err, ErrorCode::kInvalidSpec, "SplitCommandLine: argv is null");
    return false;
  }
  std::vector<std::string> out;
  std::string cur;
  bool in_token = false;
  char quote = 0;

  for (usize i = 0; i < cmd.size(); ++i) {
    const char c = cmd[i];
    if (quote == '\'') {
      if (c == '\'') {
        quote = 0;
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '\\' && i + 1 < cmd.size() && (quote == 0 || cmd[i + 1] == '"' || cmd[i + 1] == '\\')) {
      cur.push_back(cmd[++i]);
      in_token = true;
      continue;
    }
    if (quote == '"') {
      if (c == '"') {
        quote = 0;
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      in_token = true;
    } else if (c == ' ' || c == '\t' || c == '\n') {
      if (in_token) {
        out.push_back(std::move(cur));
        cur.clear();
        in_token = false;
      }
    } else {
      cur.push_back(c);
      in_token = true;
    }
  }
  if (quote != 0) {
    SetErr(err, ErrorCode::kInvalidSpec, std::string("unbalanced ") + quote + " quote in command: " + cmd);
    return false;
  }
  if (in_token) out.push_back(std::move(cur));
  if (out.empty()) {
    SetErr(err, ErrorCode::kInvalidSpec, "command is empty");
    return false;
  }
  *argv = std::move(out);
  return true;
}

std::vector<std::string> ExpandCommand(const std::vector<std::string>& argv, const RunDirectory& run) {
  std::error_code ec;
  const fs::path abs_dir = fs::absolute(run.path, ec);
  const std::string run_dir = ec ? run.path : abs_dir.string();
  const std::string input = fs::path(run.entry_input).filename().string();

  std::vector<std::string> out = argv;
  for (auto& a : out) {
    ReplaceAll(&a, "{input}", input);
    ReplaceAll(&a, "{run_id}", run.run.run_id);
    ReplaceAll(&a, "{run_dir}", run_dir);
    ReplaceAll(&a, "{seed}", std::to_string(run.run.seed));
  }
  return out;
}

bool InvokeRun(const std::string& run_dir,
               const std::vector<std::string>& argv,
               ExitStatus* status,
               Error* err) {
  if (!status) {
    SetErr(err, ErrorCode::kInvalidSpec, "InvokeRun: status is null");
    return false;
  }
  if (argv.empty()) {
    SetErr(err, ErrorCode::kInvalidSpec, "InvokeRun: empty argv");
    return false;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  Stopwatch sw;
  const pid_t pid = fork();
  if (pid < 0) {
    SetErr(err, ErrorCode::kExternalProcess, std::string("fork failed: ") + std::strerror(errno));
    return false;
  }
  if (pid == 0) {
    if (chdir(run_dir.c_str()) != 0) _exit(kExecFailedExitCode);
    execvp(cargv[0], cargv.data());
    _exit(kExecFailedExitCode);
  }

  int wstatus = 0;
  pid_t w = 0;
  do {
    w = waitpid(pid, &wstatus, 0);
  } while (w < 0 && errno == EINTR);
  if (w < 0) {
    SetErr(err, ErrorCode::kExternalProcess, std::string("waitpid failed: ") + std::strerror(errno));
    return false;
  }

  ExitStatus st;
  st.wall_ms = sw.ElapsedMillis();
  if (WIFEXITED(wstatus)) {
    st.exit_code = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus)) {
    st.signaled = true;
    st.signal = WTERMSIG(wstatus);
    st.exit_code = 128 + st.signal;
  }
  *status = st;
  return true;
}

bool InvokeBatch(const std::vector<RunDirectory>& runs,
                 const std::string& command,
                 const InvokePolicy& policy,
                 BatchReport* report,
                 Error* err) {
  if (!report) {
    SetErr(err, ErrorCode::kInvalidSpec, "InvokeBatch: report is null");
    return false;
  }
  std::vector<std::string> argv;
  if (!SplitCommandLine(command, &argv, err)) return false;

  BatchReport rep;
  for (const auto& rd : runs) {
    const std::vector<std::string> expanded = ExpandCommand(argv, rd);
    IENS_LOG_INFO("Running:", rd.run.run_id, "cwd=", rd.path, "cmd=", JoinArgs(expanded));

    RunOutcome oc;
    oc.run_id = rd.run.run_id;
    if (!InvokeRun(rd.path, expanded, &oc.status, &oc.error)) {
      AddContext(&oc.error, rd.run.run_id);
      oc.status.exit_code = kExecFailedExitCode;
    } else if (!oc.status.ok()) {
      std::string what = oc.status.signaled ? "killed by signal " + std::to_string(oc.status.signal)
                                            : "exit code " + std::to_string(oc.status.exit_code);
      SetErr(&oc.error, ErrorCode::kExternalProcess, rd.run.run_id + ": simulator failed with " + what);
    }

    if (!policy.ledger_path.empty()) {
      io::InvocationRow row;
      row.run_id = oc.run_id;
      row.exit_code = oc.status.exit_code;
      row.signaled = oc.status.signaled;
      row.signal = oc.status.signal;
      row.wall_ms = oc.status.wall_ms;
      row.ok = oc.error.ok();
      row.command = JoinArgs(expanded);
      Error lerr;
      if (!io::AppendInvocationCSV(policy.ledger_path, row, &lerr)) {
        IENS_LOG_WARN("Ledger write failed:", lerr);
      }
    }

    const bool ok = oc.error.ok();
    if (ok) {
      ++rep.succeeded;
      IENS_LOG_INFO("Finished:", rd.run.run_id, "wall_ms=", oc.status.wall_ms);
    } else {
      ++rep.failed;
      IENS_LOG_ERROR(oc.error);
    }
    const Error failure = oc.error;
    rep.outcomes.push_back(std::move(oc));

    if (!ok && policy.halt_on_failure) {
      rep.halted = true;
      *report = std::move(rep);
      SetErr(err, ErrorCode::kExternalProcess, "batch halted: " + failure.message);
      return false;
    }
  }

  *report = std::move(rep);
  return true;
}

}  // namespace ensemble
}  // namespace iens
