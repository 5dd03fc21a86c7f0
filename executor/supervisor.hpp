#ifndef EXECUTOR_SUPERVISOR_HPP
#define EXECUTOR_SUPERVISOR_HPP
#include <atomic>
#include <string>
#include <vector>

#include "executor/environment.hpp"
#include "proto/execution.pb.h"

namespace executor {

// Exit code of the outcomes of runs that could not be carried out.
static const constexpr int32_t kFailureExitCode = -1;

// One command to run under time and memory ceilings.
struct Invocation {
  std::vector<std::string> args;
  // Relative to the root of the environment; empty for no input.
  std::string stdin_file;
  int64_t time_limit_millis = 0;
  int64_t memory_limit_kb = 0;
};

class ProcessSupervisor {
 public:
  // Runs the invocation inside env and waits until it exits or is killed
  // because of a limit. Raising stop terminates it the same way as a time
  // limit. Never throws: failures of the supervisor itself are reported as
  // outcomes with failure_reason set and kFailureExitCode.
  virtual proto::ExecutionOutcome Run(Environment* env,
                                      const Invocation& invocation,
                                      const std::atomic<bool>* stop) = 0;

  ProcessSupervisor() = default;
  virtual ~ProcessSupervisor() = default;
  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
  ProcessSupervisor(ProcessSupervisor&&) = delete;
  ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;
};

// Outcome of a run that could not be carried out.
proto::ExecutionOutcome FailureOutcome(const std::string& reason);

// Reason of the outcomes of cancelled runs.
static const constexpr char* kCancelledReason = "cancelled";

}  // namespace executor

#endif
