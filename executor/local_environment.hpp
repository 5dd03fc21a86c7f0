#ifndef EXECUTOR_LOCAL_ENVIRONMENT_HPP
#define EXECUTOR_LOCAL_ENVIRONMENT_HPP

#include <memory>
#include <string>

#include "executor/environment.hpp"
#include "util/file.hpp"

namespace executor {

// Environment backed by a fresh temporary directory of the local machine.
// The session files live in the kBoxDir subfolder, while captured outputs are
// kept next to it, out of reach of the programs.
class LocalEnvironment : public Environment {
 public:
  explicit LocalEnvironment(const std::string& temp_directory);
  ~LocalEnvironment() override;

  const std::string& Root() const override { return root_; }
  void WriteFile(const std::string& name, absl::string_view content) override;
  CommandResult RunCommand(const std::vector<std::string>& args,
                           const std::string& stdin_file,
                           const std::atomic<bool>* stop) override;
  void Destroy() override;

 private:
  static const constexpr char* kBoxDir = "box";

  std::unique_ptr<util::TempDir> tmp_;
  std::string root_;
  int64_t commands_run_ = 0;
};

class LocalEnvironmentFactory : public EnvironmentFactory {
 public:
  explicit LocalEnvironmentFactory(std::string temp_directory)
      : temp_directory_(std::move(temp_directory)) {}
  std::unique_ptr<Environment> Create() override;

 private:
  std::string temp_directory_;
};

// Returns executable itself if it contains a '/', otherwise its path as found
// by util::which. Throws std::runtime_error if it cannot be found.
std::string ResolveExecutable(const std::string& executable);

}  // namespace executor

#endif
