#include "executor/monitor_protocol.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"

namespace {
// Removes the last line of text and returns it.
absl::string_view PopLine(absl::string_view* text) {
  size_t pos = text->rfind('\n');
  absl::string_view line;
  if (pos == absl::string_view::npos) {
    line = *text;
    *text = absl::string_view();
  } else {
    line = text->substr(pos + 1);
    *text = text->substr(0, pos);
  }
  return line;
}
}  // namespace

namespace executor {

std::string FormatMonitorOutput(absl::string_view output,
                                int64_t elapsed_millis,
                                int64_t peak_memory_kb) {
  std::string formatted(output);
  if (!formatted.empty() && formatted.back() != '\n') formatted += '\n';
  absl::StrAppend(&formatted, elapsed_millis, "\n", peak_memory_kb, "\n");
  return formatted;
}

bool ParseMonitorOutput(absl::string_view raw, MonitorReport* report) {
  absl::string_view rest = absl::StripTrailingAsciiWhitespace(raw);
  absl::string_view memory_line = PopLine(&rest);
  absl::string_view time_line = PopLine(&rest);
  int64_t peak_memory_kb = 0;
  int64_t elapsed_millis = 0;
  if (!absl::SimpleAtoi(memory_line, &peak_memory_kb) ||
      !absl::SimpleAtoi(time_line, &elapsed_millis)) {
    return false;
  }
  report->output = std::string(absl::StripTrailingAsciiWhitespace(rest));
  report->elapsed_millis = elapsed_millis;
  report->peak_memory_kb = peak_memory_kb;
  return true;
}

std::string ShellQuote(absl::string_view arg) {
  return absl::StrCat("'", absl::StrReplaceAll(arg, {{"'", "'\\''"}}), "'");
}

}  // namespace executor
