#include "manager/orchestrator.hpp"

#include <exception>
#include <memory>
#include <string>

#include "absl/memory/memory.h"
#include "glog/logging.h"
#include "manager/language_runner.hpp"

namespace manager {

namespace {

// Destroys the environment when the session ends, whichever way it ends.
class ScopedEnvironment {
 public:
  explicit ScopedEnvironment(std::unique_ptr<executor::Environment> env)
      : env_(std::move(env)) {}
  ~ScopedEnvironment() {
    try {
      env_->Destroy();
      LOG(INFO) << "Environment released";
    } catch (const std::exception& exc) {
      LOG(WARNING) << "Cannot release the environment: " << exc.what();
    }
  }
  executor::Environment* get() { return env_.get(); }

  ScopedEnvironment(const ScopedEnvironment&) = delete;
  ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

 private:
  std::unique_ptr<executor::Environment> env_;
};

proto::Frame SessionError(const std::string& message) {
  proto::Frame frame;
  frame.set_session_error(message);
  return frame;
}

}  // namespace

void Orchestrator::Stream(const proto::ExecuteRequest& request,
                          const FrameCallback& on_frame) {
  const int64_t total_count = request.test_cases_size();
  std::unique_ptr<LanguageRunner> runner;
  std::unique_ptr<ScopedEnvironment> env;
  try {
    runner = LanguageRunner::Create(request.language());
    env = absl::make_unique<ScopedEnvironment>(environments_->Create());
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Cannot start the session: " << exc.what();
    on_frame(SessionError(exc.what()));
    return;
  }
  LOG(INFO) << "Session started: "
            << proto::Language_Name(request.language()) << ", "
            << total_count << " test cases";

  bool failed = false;
  std::string error;
  try {
    std::pair<std::string, std::string> source =
        runner->PrepareSource(request.code());
    env->get()->WriteFile(source.first, source.second);

    proto::CompilationRecord compilation =
        runner->Compile(env->get(), supervisor_, &stop_);
    if (stop_) {
      on_frame(SessionError(executor::kCancelledReason));
      return;
    }
    if (!compilation.succeeded()) {
      proto::Frame frame;
      frame.set_compilation_error(compilation.diagnostics());
      on_frame(frame);
      return;
    }

    for (int64_t i = 0; i < total_count; i++) {
      if (stop_) {
        LOG(WARNING) << "Session cancelled before test case " << i;
        on_frame(SessionError(executor::kCancelledReason));
        return;
      }
      const proto::TestCase& test = request.test_cases(i);
      proto::ExecutionOutcome outcome;
      // A failure of a single test case does not end the session.
      try {
        RunPlan plan = runner->PrepareRun(request.code(), test.stdin());
        for (const auto& file : plan.files) {
          env->get()->WriteFile(file.first, file.second);
        }
        executor::Invocation invocation;
        invocation.args = std::move(plan.args);
        invocation.stdin_file = std::move(plan.stdin_file);
        invocation.time_limit_millis = test.time_limit_millis();
        invocation.memory_limit_kb = test.memory_limit_kb();
        outcome = supervisor_->Run(env->get(), invocation, &stop_);
      } catch (const std::exception& exc) {
        LOG(WARNING) << "Test case " << i << " failed: " << exc.what();
        outcome = executor::FailureOutcome(exc.what());
      }
      VLOG(1) << "Test case " << i << " done, exit code "
              << outcome.exit_code();
      proto::Frame frame;
      auto* result = frame.mutable_result();
      *result->mutable_outcome() = std::move(outcome);
      result->set_index(i);
      result->set_total_count(total_count);
      on_frame(frame);
    }
    if (stop_) {
      on_frame(SessionError(executor::kCancelledReason));
      return;
    }
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Session failed: " << exc.what();
    failed = true;
    error = stop_ ? executor::kCancelledReason : exc.what();
  }
  if (failed) {
    on_frame(SessionError(error));
    return;
  }
  proto::Frame complete;
  complete.mutable_complete();
  on_frame(complete);
}

proto::BatchResponse Orchestrator::Execute(
    const proto::ExecuteRequest& request) {
  proto::BatchResponse response;
  std::string reason;
  Stream(request, [&response, &reason](const proto::Frame& frame) {
    switch (frame.frame_case()) {
      case proto::Frame::kResult:
        *response.add_outcomes() = frame.result().outcome();
        break;
      case proto::Frame::kCompilationError:
        reason = frame.compilation_error();
        break;
      case proto::Frame::kSessionError:
        reason = frame.session_error();
        break;
      default:
        break;
    }
  });
  while (response.outcomes_size() < request.test_cases_size()) {
    *response.add_outcomes() = executor::FailureOutcome(reason);
  }
  return response;
}

}  // namespace manager
