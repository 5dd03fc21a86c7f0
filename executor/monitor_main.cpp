#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "executor/local_supervisor.hpp"
#include "executor/monitor_protocol.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {
const constexpr char* kUsage =
    "code_runner_monitor <time limit in seconds> <memory limit in KB> "
    "<command...>\n"
    "Runs the command with /bin/sh -c and writes its output, followed by the "
    "elapsed milliseconds and the peak memory in KB on two lines.";
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(kUsage);
  // The helper runs inside the directory of the program, keep its scratch
  // files elsewhere.
  gflags::SetCommandLineOptionWithMode(
      "temp_directory", "/tmp/code_runner_monitor", gflags::SET_FLAGS_DEFAULT);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  double seconds = 0;
  int64_t memory_limit_kb = 0;
  if (argc < 4 || !absl::SimpleAtod(argv[1], &seconds) ||
      !absl::SimpleAtoi(argv[2], &memory_limit_kb) || seconds < 0 ||
      memory_limit_kb < 0) {
    std::cerr << kUsage << std::endl;
    return 2;
  }
  std::vector<std::string> words(argv + 3, argv + argc);

  executor::Invocation invocation;
  invocation.args = {"/bin/sh", "-c", absl::StrJoin(words, " ")};
  invocation.time_limit_millis = std::llround(seconds * 1000);
  invocation.memory_limit_kb = memory_limit_kb;

  try {
    util::TempDir tmp(FLAGS_temp_directory);
    sandbox::ExecutionOptions options(".", invocation.args[0]);
    options.args.assign(invocation.args.begin() + 1, invocation.args.end());
    options.stdin_file = "/dev/stdin";
    options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
    options.wall_limit_millis = invocation.time_limit_millis;
    options.memory_limit_kb = invocation.memory_limit_kb;
    options.max_file_size_kb = FLAGS_max_output_kb;
    options.poll_interval_millis = FLAGS_poll_interval_millis;
    options.kill_grace_millis = FLAGS_kill_grace_millis;

    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    sandbox::ExecutionInfo info;
    std::string error_msg;
    if (!sb->Execute(options, &info, &error_msg)) {
      std::cerr << "code_runner_monitor: " << error_msg << std::endl;
      return 1;
    }
    proto::ExecutionOutcome outcome =
        executor::OutcomeFromExecution(invocation, info);
    std::string output =
        util::File::Contents(options.stdout_file, FLAGS_max_output_kb * 1024);
    std::cout << executor::FormatMonitorOutput(output, outcome.elapsed_millis(),
                                               outcome.peak_memory_kb())
              << std::flush;
    if (outcome.has_failure_reason()) {
      std::cerr << "code_runner_monitor: " << outcome.failure_reason()
                << std::endl;
    }
    return outcome.exit_code();
  } catch (const std::exception& exc) {
    std::cerr << "code_runner_monitor: " << exc.what() << std::endl;
    return 1;
  }
}
