#ifndef SANDBOX_RESOURCE_MONITOR_HPP
#define SANDBOX_RESOURCE_MONITOR_HPP

#include <sys/types.h>

#include <chrono>
#include <cstdint>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace sandbox {

struct ResourceSample {
  int64_t elapsed_millis = 0;
  int64_t memory_kb = 0;
};

// Periodically samples the resident memory of a process tree and the wall
// time elapsed since its start. The watch is a finite sequence of samples,
// consumed by calling Next() until it returns false:
//
//   ResourceMonitor monitor(pid, 1000, 65536, kInterval, start);
//   ResourceSample sample;
//   while (monitor.Next(&sample)) { ... }
//   if (monitor.Result() == ResourceMonitor::TIME_LIMIT) { ... }
//
// Only Cancel() may be called from a thread other than the consumer.
class ResourceMonitor {
 public:
  enum Verdict { WATCHING, EXITED, TIME_LIMIT, MEMORY_LIMIT, CANCELLED };

  // A limit of 0 disables the corresponding check. reaper is passed on to
  // ListProcessTree.
  ResourceMonitor(pid_t root, int64_t time_limit_millis, int64_t memory_limit_kb,
                  std::chrono::milliseconds poll_interval,
                  std::chrono::steady_clock::time_point start,
                  pid_t reaper = 0);

  // Total resident memory of the tree rooted at root, in KB; 0 if the tree
  // has no live process.
  static int64_t Sample(pid_t root);

  // Waits for the next tick (the first sample is taken immediately) and
  // samples the tree. Returns false, without filling sample, once the watch is
  // over: the tree has no live process, a limit was breached on the previous
  // sample, or Cancel() was called.
  bool Next(ResourceSample* sample);

  // Ends the watch. Wakes up a consumer blocked in Next().
  void Cancel();

  Verdict Result() const { return verdict_; }
  int64_t MaxMemoryKb() const { return max_memory_kb_; }

  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;
  ResourceMonitor(ResourceMonitor&&) = delete;
  ResourceMonitor& operator=(ResourceMonitor&&) = delete;

 private:
  // Sleeps until deadline or until Cancel(). Returns true if cancelled.
  bool SleepUntil(std::chrono::steady_clock::time_point deadline);

  const pid_t root_;
  const int64_t time_limit_millis_;
  const int64_t memory_limit_kb_;
  const std::chrono::milliseconds poll_interval_;
  const std::chrono::steady_clock::time_point start_;
  const pid_t reaper_;

  std::chrono::steady_clock::time_point next_tick_;
  Verdict verdict_ = WATCHING;
  int64_t max_memory_kb_ = 0;

  absl::Mutex cancel_mutex_;
  bool cancelled_ ABSL_GUARDED_BY(cancel_mutex_) = false;
};

}  // namespace sandbox

#endif
