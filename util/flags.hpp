#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);

DECLARE_int32(poll_interval_millis);
DECLARE_int32(kill_grace_millis);
DECLARE_int32(timeout_exit_code);
DECLARE_int32(memory_exit_code);
DECLARE_int64(max_output_kb);

DECLARE_int64(compile_time_limit_millis);
DECLARE_int64(compile_memory_limit_kb);

DECLARE_string(supervisor);
DECLARE_string(monitor_binary);

#endif
