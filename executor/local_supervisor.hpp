#ifndef EXECUTOR_LOCAL_SUPERVISOR_HPP
#define EXECUTOR_LOCAL_SUPERVISOR_HPP

#include <string>

#include "executor/supervisor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Supervises the program directly, through the sandbox of this machine. The
// environment must be local: the program runs in its Root() directory.
class LocalSupervisor : public ProcessSupervisor {
 public:
  // Captured outputs are written in temporary folders under temp_directory.
  explicit LocalSupervisor(std::string temp_directory)
      : temp_directory_(std::move(temp_directory)) {}

  proto::ExecutionOutcome Run(Environment* env, const Invocation& invocation,
                              const std::atomic<bool>* stop) override;

 private:
  proto::ExecutionOutcome DoRun(Environment* env, const Invocation& invocation,
                                const std::atomic<bool>* stop);

  std::string temp_directory_;
};

// Turns the results of a sandboxed execution into an outcome, applying the
// exit code mapping of the limit kills and clamping the elapsed time to the
// time limit.
proto::ExecutionOutcome OutcomeFromExecution(
    const Invocation& invocation, const sandbox::ExecutionInfo& info);

}  // namespace executor

#endif
