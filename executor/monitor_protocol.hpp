#ifndef EXECUTOR_MONITOR_PROTOCOL_HPP
#define EXECUTOR_MONITOR_PROTOCOL_HPP
#include <string>

#include "absl/strings/string_view.h"

namespace executor {

// The monitor helper writes the standard output of the program, then, on a
// line of their own, the elapsed milliseconds and the peak memory in KB:
//
//   <output of the program>
//   153
//   2048
struct MonitorReport {
  std::string output;
  int64_t elapsed_millis = 0;
  int64_t peak_memory_kb = 0;
};

std::string FormatMonitorOutput(absl::string_view output,
                                int64_t elapsed_millis, int64_t peak_memory_kb);

// Pops the two trailing lines off raw. The remaining output loses its
// trailing whitespace. Returns false if raw does not end with two numbers.
bool ParseMonitorOutput(absl::string_view raw, MonitorReport* report);

// Quotes arg so that /bin/sh reads it as a single word.
std::string ShellQuote(absl::string_view arg);

}  // namespace executor

#endif
