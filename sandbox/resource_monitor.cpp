#include "sandbox/resource_monitor.hpp"

#include <vector>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "sandbox/process_tree.hpp"

namespace sandbox {

ResourceMonitor::ResourceMonitor(pid_t root, int64_t time_limit_millis,
                                 int64_t memory_limit_kb,
                                 std::chrono::milliseconds poll_interval,
                                 std::chrono::steady_clock::time_point start,
                                 pid_t reaper)
    : root_(root),
      time_limit_millis_(time_limit_millis),
      memory_limit_kb_(memory_limit_kb),
      poll_interval_(poll_interval),
      start_(start),
      reaper_(reaper),
      next_tick_(std::chrono::steady_clock::now()) {}

int64_t ResourceMonitor::Sample(pid_t root) {
  return ProcessTreeMemoryKb(root);
}

bool ResourceMonitor::Next(ResourceSample* sample) {
  if (verdict_ != WATCHING) return false;
  if (SleepUntil(next_tick_)) {
    verdict_ = CANCELLED;
    return false;
  }
  next_tick_ += poll_interval_;

  std::vector<pid_t> tree = ListProcessTree(root_, reaper_);
  if (tree.empty()) {
    verdict_ = EXITED;
    return false;
  }
  int64_t memory_kb = 0;
  for (pid_t pid : tree) memory_kb += ResidentMemoryKb(pid);
  int64_t elapsed_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start_)
          .count();

  if (memory_kb > max_memory_kb_) max_memory_kb_ = memory_kb;
  sample->elapsed_millis = elapsed_millis;
  sample->memory_kb = memory_kb;
  VLOG(2) << "pid " << root_ << ": " << tree.size() << " processes, "
          << memory_kb << " KB, " << elapsed_millis << " ms";

  // Reaching the time limit exactly counts as exceeding it, as the next
  // sample could come after the real deadline. Memory equal to the limit is
  // allowed.
  if (time_limit_millis_ > 0 && elapsed_millis >= time_limit_millis_) {
    verdict_ = TIME_LIMIT;
  } else if (memory_limit_kb_ > 0 && memory_kb > memory_limit_kb_) {
    verdict_ = MEMORY_LIMIT;
  }
  return true;
}

void ResourceMonitor::Cancel() {
  absl::MutexLock lck(&cancel_mutex_);
  cancelled_ = true;
}

bool ResourceMonitor::SleepUntil(std::chrono::steady_clock::time_point deadline) {
  auto remaining = deadline - std::chrono::steady_clock::now();
  absl::Duration timeout = absl::FromChrono(
      std::chrono::duration_cast<std::chrono::microseconds>(remaining));
  absl::MutexLock lck(&cancel_mutex_);
  if (timeout > absl::ZeroDuration()) {
    cancel_mutex_.AwaitWithTimeout(absl::Condition(&cancelled_), timeout);
  }
  return cancelled_;
}

}  // namespace sandbox
