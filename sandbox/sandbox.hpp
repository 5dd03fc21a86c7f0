#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Sampled limits, enforced by killing the whole process tree. Zero means no
  // limit.
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;

  // Kernel-enforced limits of the child (setrlimit). Zero means unset.
  int64_t cpu_limit_millis = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  int64_t poll_interval_millis = 20;
  int64_t kill_grace_millis = 500;

  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;

  // When set, raising the flag from another thread stops the execution as if
  // the time limit had been exceeded.
  const std::atomic<bool>* stop = nullptr;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;

  // Set when the process tree was killed by the sandbox; at most one is true.
  bool timed_out = false;
  bool memory_exceeded = false;
  bool stopped = false;

  // False if some process of the tree could still be alive.
  bool tree_terminated = true;
  std::string message;
};

// Sandbox interface: runs a single command, with the limits and redirections
// described by ExecutionOptions, and reports how it ended.
class Sandbox {
 public:
  // Creates the sandbox for the current platform.
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
