#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <queue>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/execution.pb.h"

namespace manager {

// Frames of a session, produced by the thread running it and consumed by the
// thread writing them out.
class EventQueue {
 public:
  void Enqueue(proto::Frame&& frame);

  // Blocks until a frame is available. Returns an empty optional once the
  // queue is stopped and every frame was dequeued.
  absl::optional<proto::Frame> Dequeue();
  void Stop();

 private:
  absl::Mutex queue_mutex_;
  std::queue<proto::Frame> queue_ ABSL_GUARDED_BY(queue_mutex_);
  bool stopped_ ABSL_GUARDED_BY(queue_mutex_) = false;
};

// True for the frames that end a session.
bool IsTerminal(const proto::Frame& frame);

}  // namespace manager

#endif
