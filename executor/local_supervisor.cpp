#include "executor/local_supervisor.hpp"

#include <signal.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "executor/local_environment.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace executor {

proto::ExecutionOutcome OutcomeFromExecution(
    const Invocation& invocation, const sandbox::ExecutionInfo& info) {
  proto::ExecutionOutcome outcome;
  outcome.set_peak_memory_kb(info.memory_usage_kb);
  int64_t elapsed = info.wall_time_millis;
  if (invocation.time_limit_millis > 0) {
    elapsed = std::min(elapsed, invocation.time_limit_millis);
  }
  outcome.set_elapsed_millis(elapsed);

  // The CPU time backstop counts the time of every thread, so a program with
  // several busy threads reaches it before the wall time limit.
  const bool cpu_limit =
      info.signal == SIGXCPU && invocation.time_limit_millis > 0;
  if (info.timed_out || cpu_limit) {
    outcome.set_timed_out(true);
    outcome.set_exit_code(FLAGS_timeout_exit_code);
  } else if (info.memory_exceeded) {
    outcome.set_memory_exceeded(true);
    outcome.set_exit_code(FLAGS_memory_exit_code);
  } else if (info.stopped) {
    outcome.set_exit_code(FLAGS_timeout_exit_code);
    outcome.set_failure_reason(kCancelledReason);
  } else if (info.signal) {
    outcome.set_exit_code(128 + info.signal);
  } else {
    outcome.set_exit_code(info.status_code);
  }

  if (!info.tree_terminated) {
    LOG(ERROR) << "Run of " << invocation.args[0] << ": " << info.message;
    outcome.set_failure_reason(info.message);
  }
  return outcome;
}

proto::ExecutionOutcome LocalSupervisor::Run(Environment* env,
                                             const Invocation& invocation,
                                             const std::atomic<bool>* stop) {
  try {
    return DoRun(env, invocation, stop);
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Supervisor failure: " << exc.what();
    return FailureOutcome(exc.what());
  }
}

proto::ExecutionOutcome LocalSupervisor::DoRun(Environment* env,
                                               const Invocation& invocation,
                                               const std::atomic<bool>* stop) {
  if (invocation.args.empty()) throw std::invalid_argument("Empty command");
  util::TempDir tmp(temp_directory_);

  sandbox::ExecutionOptions options(env->Root(),
                                    ResolveExecutable(invocation.args[0]));
  options.args.assign(invocation.args.begin() + 1, invocation.args.end());
  if (!invocation.stdin_file.empty()) {
    options.stdin_file =
        util::File::JoinPath(env->Root(), invocation.stdin_file);
  }
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

  // Limits.
  options.wall_limit_millis = invocation.time_limit_millis;
  options.memory_limit_kb = invocation.memory_limit_kb;
  // CPU time only catches what the wall clock misses by a large margin.
  if (invocation.time_limit_millis > 0) {
    options.cpu_limit_millis = invocation.time_limit_millis * 2 + 1000;
  }
  options.max_file_size_kb = FLAGS_max_output_kb;
  options.poll_interval_millis = FLAGS_poll_interval_millis;
  options.kill_grace_millis = FLAGS_kill_grace_millis;
  options.stop = stop;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(options, &info, &error_msg)) {
    throw std::runtime_error(error_msg);
  }

  proto::ExecutionOutcome outcome = OutcomeFromExecution(invocation, info);
  const int64_t max_bytes = FLAGS_max_output_kb * 1024;
  outcome.set_stdout(util::File::Contents(options.stdout_file, max_bytes));
  outcome.set_stderr(util::File::Contents(options.stderr_file, max_bytes));
  VLOG(1) << invocation.args[0] << " exited with " << outcome.exit_code()
          << " after " << outcome.elapsed_millis() << " ms, "
          << outcome.peak_memory_kb() << " KB";
  return outcome;
}

}  // namespace executor
