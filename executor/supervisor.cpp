#include "executor/supervisor.hpp"

namespace executor {

proto::ExecutionOutcome FailureOutcome(const std::string& reason) {
  proto::ExecutionOutcome outcome;
  outcome.set_exit_code(kFailureExitCode);
  outcome.set_failure_reason(reason);
  return outcome;
}

}  // namespace executor
