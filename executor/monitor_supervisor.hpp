#ifndef EXECUTOR_MONITOR_SUPERVISOR_HPP
#define EXECUTOR_MONITOR_SUPERVISOR_HPP

#include <string>

#include "executor/supervisor.hpp"

namespace executor {

// Delegates the enforcement of the limits to the monitor helper, run through
// Environment::RunCommand as
//
//   <monitor_binary> <time limit in seconds> <memory limit in KB> '<command>'
//
// The exit codes --timeout_exit_code and --memory_exit_code of the helper
// report limit kills. As with every helper of this kind, a program exiting
// on its own with one of those codes is reported as killed.
class MonitorSupervisor : public ProcessSupervisor {
 public:
  explicit MonitorSupervisor(std::string monitor_binary)
      : monitor_binary_(std::move(monitor_binary)) {}

  proto::ExecutionOutcome Run(Environment* env, const Invocation& invocation,
                              const std::atomic<bool>* stop) override;

 private:
  std::string monitor_binary_;
};

}  // namespace executor

#endif
