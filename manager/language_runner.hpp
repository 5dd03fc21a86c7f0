#ifndef MANAGER_LANGUAGE_RUNNER_HPP
#define MANAGER_LANGUAGE_RUNNER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "executor/environment.hpp"
#include "executor/supervisor.hpp"
#include "manager/language.hpp"
#include "proto/execution.pb.h"

namespace manager {

// What has to be written and run for a single test case.
struct RunPlan {
  // Files to write before the run, as (name, content) pairs.
  std::vector<std::pair<std::string, std::string>> files;
  std::vector<std::string> args;
  // Empty when the input is not read from the standard input.
  std::string stdin_file;
};

// Turns the source code of a language into files and commands.
class LanguageRunner {
 public:
  // Throws std::domain_error if the language is not supported.
  static std::unique_ptr<LanguageRunner> Create(proto::Language language);

  // Name and content of the source file of code.
  std::pair<std::string, std::string> PrepareSource(
      const std::string& code) const;

  // Compiles the source file, already written in env. Languages that are not
  // compiled always succeed without running anything.
  virtual proto::CompilationRecord Compile(
      executor::Environment* env, executor::ProcessSupervisor* supervisor,
      const std::atomic<bool>* stop) const = 0;

  virtual RunPlan PrepareRun(const std::string& code,
                             const std::string& stdin) const = 0;

  const LanguageSpec& Spec() const { return spec_; }

  virtual ~LanguageRunner() = default;
  LanguageRunner(const LanguageRunner&) = delete;
  LanguageRunner(LanguageRunner&&) = delete;
  LanguageRunner& operator=(const LanguageRunner&) = delete;
  LanguageRunner& operator=(LanguageRunner&&) = delete;

  static const constexpr char* kStdinFile = "stdin.txt";

 protected:
  explicit LanguageRunner(const LanguageSpec& spec) : spec_(spec) {}

  const LanguageSpec& spec_;
};

// Source of a Python or JavaScript program whose input() returns the lines
// of stdin.
std::string WrapWithStdin(proto::Language language, const std::string& code,
                          const std::string& stdin);

// Wraps bare Java statements in a Main class. Code that already declares
// class Main is returned unchanged.
std::string WrapJavaMain(const std::string& code);

}  // namespace manager

#endif
