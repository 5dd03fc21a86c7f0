#include "util/flags.hpp"

DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the sandbox directories when a session ends");

DEFINE_int32(poll_interval_millis, 20,
             "Interval between two samples of the resource monitor");
DEFINE_int32(kill_grace_millis, 500,
             "Time between SIGTERM and SIGKILL when a process tree is "
             "terminated. Values above 1000 are capped");
DEFINE_int32(timeout_exit_code, 124,
             "Exit code reported for a run killed because of the time limit");
DEFINE_int32(memory_exit_code, 137,
             "Exit code reported for a run killed because of the memory limit");
DEFINE_int64(max_output_kb, 64 * 1024,
             "Maximum amount of stdout/stderr kept for each run");

DEFINE_int64(compile_time_limit_millis, 10000,
             "Wall time limit of the compilation step");
DEFINE_int64(compile_memory_limit_kb, 1024 * 1024,
             "Memory limit of the compilation step");

DEFINE_string(supervisor, "local",
              "How limits are enforced: 'local' supervises the process "
              "directly, 'monitor' delegates to the monitor helper");
DEFINE_string(monitor_binary, "/usr/local/bin/code_runner_monitor",
              "Path of the monitor helper used by --supervisor=monitor");
