#include "executor/local_environment.hpp"

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "absl/memory/memory.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {
bool IsIllegalChar(char c) {
  return !isalnum(c) && c != '.' && c != '-' && c != '_';
}

std::string Absolute(const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  char cwd[PATH_MAX] = {};
  if (getcwd(cwd, PATH_MAX) == nullptr)
    throw std::system_error(errno, std::system_category(), "getcwd");
  return util::File::JoinPath(cwd, path);
}

// Reads a captured output, then removes it.
std::string TakeOutput(const std::string& path) {
  std::string output = util::File::Contents(path, FLAGS_max_output_kb * 1024);
  util::File::Remove(path);
  return output;
}
}  // namespace

namespace executor {

std::string ResolveExecutable(const std::string& executable) {
  if (executable.find('/') != std::string::npos) return executable;
  std::string path = util::which(executable);
  if (path.empty()) {
    throw std::runtime_error(executable + ": command not found");
  }
  return path;
}

LocalEnvironment::LocalEnvironment(const std::string& temp_directory)
    : tmp_(absl::make_unique<util::TempDir>(Absolute(temp_directory))) {
  if (FLAGS_keep_sandboxes) tmp_->Keep();
  root_ = util::File::JoinPath(tmp_->Path(), kBoxDir);
  util::File::MakeDirs(root_);
  VLOG(1) << "Created environment " << root_;
}

LocalEnvironment::~LocalEnvironment() { Destroy(); }

void LocalEnvironment::WriteFile(const std::string& name,
                                 absl::string_view content) {
  if (!tmp_) throw std::logic_error("The environment was destroyed");
  if (name.empty() ||
      std::find_if(name.begin(), name.end(), IsIllegalChar) != name.end()) {
    throw std::runtime_error("Invalid file name: " + name);
  }
  util::File::Write(util::File::JoinPath(root_, name), content);
}

CommandResult LocalEnvironment::RunCommand(const std::vector<std::string>& args,
                                           const std::string& stdin_file,
                                           const std::atomic<bool>* stop) {
  if (!tmp_) throw std::logic_error("The environment was destroyed");
  if (args.empty()) throw std::invalid_argument("Empty command");

  sandbox::ExecutionOptions options(root_, ResolveExecutable(args[0]));
  options.args.assign(args.begin() + 1, args.end());
  if (!stdin_file.empty()) {
    options.stdin_file = util::File::JoinPath(root_, stdin_file);
  }
  std::string prefix = util::File::JoinPath(
      tmp_->Path(), "command" + std::to_string(commands_run_++));
  options.stdout_file = prefix + ".stdout";
  options.stderr_file = prefix + ".stderr";
  options.poll_interval_millis = FLAGS_poll_interval_millis;
  options.kill_grace_millis = FLAGS_kill_grace_millis;
  options.stop = stop;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(options, &info, &error_msg)) {
    throw std::runtime_error(error_msg);
  }
  if (!info.tree_terminated) {
    throw std::runtime_error(info.message);
  }

  CommandResult result;
  result.output = TakeOutput(options.stdout_file);
  result.error_output = TakeOutput(options.stderr_file);
  result.exit_code = info.signal ? 128 + info.signal : info.status_code;
  return result;
}

void LocalEnvironment::Destroy() {
  if (!tmp_) return;
  VLOG(1) << "Destroying environment " << root_;
  tmp_.reset();
}

std::unique_ptr<Environment> LocalEnvironmentFactory::Create() {
  return absl::make_unique<LocalEnvironment>(temp_directory_);
}

}  // namespace executor
