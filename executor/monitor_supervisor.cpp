#include "executor/monitor_supervisor.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "executor/monitor_protocol.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace executor {

proto::ExecutionOutcome MonitorSupervisor::Run(Environment* env,
                                               const Invocation& invocation,
                                               const std::atomic<bool>* stop) {
  try {
    if (invocation.args.empty()) throw std::invalid_argument("Empty command");
    std::vector<std::string> quoted;
    for (const std::string& arg : invocation.args) {
      quoted.push_back(ShellQuote(arg));
    }
    std::vector<std::string> args = {
        monitor_binary_, absl::StrCat(invocation.time_limit_millis / 1000.0),
        absl::StrCat(invocation.memory_limit_kb), absl::StrJoin(quoted, " ")};
    CommandResult result = env->RunCommand(args, invocation.stdin_file, stop);

    MonitorReport report;
    if (!ParseMonitorOutput(result.output, &report)) {
      // The monitor was killed before it could report.
      if (stop != nullptr && stop->load()) {
        proto::ExecutionOutcome outcome = FailureOutcome(kCancelledReason);
        outcome.set_exit_code(FLAGS_timeout_exit_code);
        return outcome;
      }
      throw std::runtime_error("Unexpected output of the monitor (exit code " +
                               std::to_string(result.exit_code) +
                               "): " + result.error_output);
    }
    proto::ExecutionOutcome outcome;
    outcome.set_stdout(report.output);
    outcome.set_stderr(result.error_output);
    outcome.set_exit_code(result.exit_code);
    outcome.set_peak_memory_kb(report.peak_memory_kb);
    int64_t elapsed = report.elapsed_millis;
    if (invocation.time_limit_millis > 0) {
      elapsed = std::min(elapsed, invocation.time_limit_millis);
    }
    outcome.set_elapsed_millis(elapsed);
    if (result.exit_code == FLAGS_timeout_exit_code) {
      outcome.set_timed_out(true);
    } else if (result.exit_code == FLAGS_memory_exit_code) {
      outcome.set_memory_exceeded(true);
    }
    return outcome;
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Supervisor failure: " << exc.what();
    return FailureOutcome(exc.what());
  }
}

}  // namespace executor
