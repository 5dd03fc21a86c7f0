#ifndef EXECUTOR_ENVIRONMENT_HPP
#define EXECUTOR_ENVIRONMENT_HPP
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace executor {

struct CommandResult {
  std::string output;
  std::string error_output;
  int32_t exit_code = 0;
};

// A place where the files of a session can be written and commands can be
// run. Environments are not thread safe and belong to a single session.
class Environment {
 public:
  // Directory where files are written and commands are run.
  virtual const std::string& Root() const = 0;

  // Writes content to the file name, relative to Root(). Throws
  // std::system_error on failure.
  virtual void WriteFile(const std::string& name,
                         absl::string_view content) = 0;

  // Runs args[0] (looked up in PATH if it contains no '/') in Root(), with
  // standard input read from stdin_file (relative to Root(), none if empty),
  // and captures its output. The exit code of a process killed by a signal
  // is 128 + signal. Raising stop kills the command. Throws if the command
  // could not be started.
  virtual CommandResult RunCommand(const std::vector<std::string>& args,
                                   const std::string& stdin_file,
                                   const std::atomic<bool>* stop) = 0;

  // Releases the environment. Calling it more than once has no effect.
  virtual void Destroy() = 0;

  Environment() = default;
  virtual ~Environment() = default;
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;
  Environment(Environment&&) = delete;
  Environment& operator=(Environment&&) = delete;
};

class EnvironmentFactory {
 public:
  // Creates a new, empty environment. Throws if that is not possible.
  virtual std::unique_ptr<Environment> Create() = 0;

  EnvironmentFactory() = default;
  virtual ~EnvironmentFactory() = default;
  EnvironmentFactory(const EnvironmentFactory&) = delete;
  EnvironmentFactory& operator=(const EnvironmentFactory&) = delete;
};

}  // namespace executor

#endif
