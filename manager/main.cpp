#include <pthread.h>
#include <signal.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>

#include "absl/types/optional.h"
#include "executor/local_environment.hpp"
#include "executor/supervisor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/event_queue.hpp"
#include "manager/orchestrator.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(request, "-", "JSON file with the request, - for stdin");
DEFINE_string(output, "-", "Where to write the response, - for stdout");
DEFINE_bool(stream, false,
            "Write the frames of the session as they are produced, one JSON "
            "object per line, instead of a single response at the end");
DEFINE_int32(max_test_cases, 20, "Maximum number of test cases of a request");

namespace {

std::string ReadRequest(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Contents(path);
}

// Returns an error message if the request cannot be run.
absl::optional<std::string> Validate(const proto::ExecuteRequest& request) {
  if (request.test_cases_size() > FLAGS_max_test_cases) {
    return "Too many test cases: " + std::to_string(request.test_cases_size()) +
           " (at most " + std::to_string(FLAGS_max_test_cases) + ")";
  }
  for (int i = 0; i < request.test_cases_size(); i++) {
    const proto::TestCase& test = request.test_cases(i);
    if (test.time_limit_millis() <= 0 || test.memory_limit_kb() <= 0) {
      return "Test case " + std::to_string(i) + " has invalid limits";
    }
  }
  return {};
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << status.ToString();
  return json;
}

// SIGINT and SIGTERM cancel the session. Must be called before starting any
// other thread, so that they all inherit the blocked signals.
void CancelOnSignals(manager::Orchestrator* orchestrator) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  CHECK_EQ(pthread_sigmask(SIG_BLOCK, &signals, nullptr), 0);
  std::thread([signals, orchestrator]() {
    int sig = 0;
    while (sigwait(&signals, &sig) == 0) {
      LOG(WARNING) << "Received signal " << sig << ", stopping the session";
      orchestrator->Stop();
    }
  }).detach();
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "code_runner --request=<file> [--stream] [--output=<file>]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  CHECK_LE(FLAGS_kill_grace_millis, 1000) << "--kill_grace_millis too large";
  CHECK_GT(FLAGS_poll_interval_millis, 0) << "--poll_interval_millis too small";
  std::unique_ptr<executor::ProcessSupervisor> supervisor =
      executor::SupervisorBuilder::Get(FLAGS_supervisor);
  CHECK(supervisor) << "Unknown supervisor " << FLAGS_supervisor;

  proto::ExecuteRequest request;
  try {
    auto status = google::protobuf::util::JsonStringToMessage(
        ReadRequest(FLAGS_request), &request);
    if (!status.ok()) {
      std::cerr << "Invalid request: " << status.ToString() << std::endl;
      return 1;
    }
  } catch (const std::system_error& exc) {
    std::cerr << "Cannot read the request: " << exc.what() << std::endl;
    return 1;
  }
  absl::optional<std::string> invalid = Validate(request);
  if (invalid) {
    std::cerr << *invalid << std::endl;
    return 1;
  }

  std::ofstream output_file;
  std::ostream* output = &std::cout;
  if (FLAGS_output != "-") {
    output_file.open(FLAGS_output);
    if (!output_file) {
      std::cerr << "Cannot open " << FLAGS_output << std::endl;
      return 1;
    }
    output = &output_file;
  }

  executor::LocalEnvironmentFactory environments(FLAGS_temp_directory);
  manager::Orchestrator orchestrator(&environments, supervisor.get());
  CancelOnSignals(&orchestrator);

  if (FLAGS_stream) {
    manager::EventQueue queue;
    std::thread session([&orchestrator, &request, &queue]() {
      orchestrator.Stream(request, [&queue](const proto::Frame& frame) {
        queue.Enqueue(proto::Frame(frame));
        if (manager::IsTerminal(frame)) queue.Stop();
      });
    });
    absl::optional<proto::Frame> frame;
    while ((frame = queue.Dequeue())) {
      *output << ToJson(*frame) << std::endl;
    }
    session.join();
  } else {
    *output << ToJson(orchestrator.Execute(request)) << std::endl;
  }
  return output->good() ? 0 : 1;
}
