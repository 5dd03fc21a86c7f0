#ifndef MANAGER_ORCHESTRATOR_HPP
#define MANAGER_ORCHESTRATOR_HPP

#include <atomic>
#include <functional>

#include "executor/environment.hpp"
#include "executor/supervisor.hpp"
#include "proto/execution.pb.h"

namespace manager {

// Runs sessions: the source is written and compiled once in a fresh
// environment, then every test case is run in order against it.
class Orchestrator {
 public:
  using FrameCallback = std::function<void(const proto::Frame& frame)>;

  Orchestrator(executor::EnvironmentFactory* environments,
               executor::ProcessSupervisor* supervisor)
      : environments_(environments), supervisor_(supervisor) {}

  // Runs a session, calling on_frame as soon as each frame is ready. The
  // last frame is always the only one among compilation_error,
  // session_error and complete. The environment of the session is destroyed
  // before returning.
  void Stream(const proto::ExecuteRequest& request,
              const FrameCallback& on_frame);

  // Runs a session and returns one outcome per test case, in order. When
  // the session ends early (compilation failure, session error or Stop())
  // the missing outcomes carry the reason as failure_reason.
  proto::BatchResponse Execute(const proto::ExecuteRequest& request);

  // Cancels the running session, and every following one. Can be called from
  // any thread.
  void Stop() { stop_ = true; }

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  Orchestrator& operator=(Orchestrator&&) = delete;

 private:
  executor::EnvironmentFactory* environments_;
  executor::ProcessSupervisor* supervisor_;
  std::atomic<bool> stop_{false};
};

}  // namespace manager

#endif
