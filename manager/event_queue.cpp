#include "manager/event_queue.hpp"

namespace manager {

void EventQueue::Enqueue(proto::Frame&& frame) {
  absl::MutexLock lck(&queue_mutex_);
  queue_.push(std::move(frame));
}

absl::optional<proto::Frame> EventQueue::Dequeue() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return stopped_ || !queue_.empty();
  };
  queue_mutex_.Await(absl::Condition(&cond));
  if (queue_.empty()) return {};
  absl::optional<proto::Frame> frame = std::move(queue_.front());
  queue_.pop();
  return frame;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}

bool IsTerminal(const proto::Frame& frame) {
  return frame.frame_case() == proto::Frame::kCompilationError ||
         frame.frame_case() == proto::Frame::kSessionError ||
         frame.frame_case() == proto::Frame::kComplete;
}

}  // namespace manager
