#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <chrono>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The child runs in a new session, so that its
// whole process tree can be found and killed, and is watched by a
// ResourceMonitor while another thread waits for its exit; the first of the
// two to finish decides how the execution ended.
//
// The calling process becomes a child subreaper, and any child of it other
// than the running program counts as a detached member of its tree: a process
// runs at most one Unix sandbox at a time.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its process tree if it
  // exceeds one of the limits or if the execution is stopped.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  // This process when it is a subreaper, otherwise 0.
  pid_t reaper_ = 0;
  std::chrono::steady_clock::time_point start_;
  const ExecutionOptions* options_ = nullptr;

  // Arguments of exec, prepared before forking so that the child does not
  // need to allocate memory.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
};

}  // namespace sandbox
#endif
