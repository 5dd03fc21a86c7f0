#include "manager/language_runner.hpp"

#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/substitute.h"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace manager {

namespace {

const constexpr char* kPythonWrapper = R"(import base64
import sys

_input_lines = base64.b64decode("$0").decode(errors="replace").strip().split("\n")
_input_index = 0


def input(prompt=""):
    global _input_index
    if _input_index < len(_input_lines):
        line = _input_lines[_input_index]
        _input_index += 1
        return line
    return ""


$1
)";

const constexpr char* kJavaScriptWrapper =
    R"(const input = (lines => () => lines.pop() || "")(
    Buffer.from("$0", "base64").toString().split("\n").map(line => line.trim()).reverse());

(() => {
$1
})();
)";

const constexpr char* kJavaWrapper = R"(import java.util.*;
import java.io.*;

public class Main {
    public static void main(String[] args) throws Exception {
$0
    }
}
)";

class CompiledRunner : public LanguageRunner {
 public:
  explicit CompiledRunner(const LanguageSpec& spec) : LanguageRunner(spec) {}

  proto::CompilationRecord Compile(
      executor::Environment* env, executor::ProcessSupervisor* supervisor,
      const std::atomic<bool>* stop) const override;

  RunPlan PrepareRun(const std::string& code,
                     const std::string& stdin) const override {
    RunPlan plan;
    plan.files.emplace_back(std::string(kStdinFile), stdin);
    plan.args = spec_.execute_command;
    plan.stdin_file = kStdinFile;
    return plan;
  }
};

class NotCompiledRunner : public LanguageRunner {
 public:
  explicit NotCompiledRunner(const LanguageSpec& spec)
      : LanguageRunner(spec) {}

  proto::CompilationRecord Compile(
      executor::Environment* env, executor::ProcessSupervisor* supervisor,
      const std::atomic<bool>* stop) const override {
    proto::CompilationRecord record;
    record.set_succeeded(true);
    return record;
  }

  RunPlan PrepareRun(const std::string& code,
                     const std::string& stdin) const override {
    RunPlan plan;
    if (spec_.stdin_strategy == StdinStrategy::INLINE_WRAPPER) {
      plan.files.emplace_back(spec_.source_file,
                              WrapWithStdin(spec_.language, code, stdin));
    } else {
      plan.files.emplace_back(std::string(kStdinFile), stdin);
      plan.stdin_file = kStdinFile;
    }
    plan.args = spec_.execute_command;
    return plan;
  }
};

proto::CompilationRecord CompiledRunner::Compile(
    executor::Environment* env, executor::ProcessSupervisor* supervisor,
    const std::atomic<bool>* stop) const {
  executor::Invocation invocation;
  invocation.args = spec_.compile_command;
  invocation.time_limit_millis = FLAGS_compile_time_limit_millis;
  invocation.memory_limit_kb = FLAGS_compile_memory_limit_kb;
  LOG(INFO) << "Compiling " << spec_.source_file;
  proto::ExecutionOutcome outcome = supervisor->Run(env, invocation, stop);
  if (outcome.has_failure_reason()) {
    throw std::runtime_error("Cannot compile " + spec_.source_file + ": " +
                             outcome.failure_reason());
  }

  proto::CompilationRecord record;
  std::string diagnostics =
      outcome.stderr().empty() ? outcome.stdout() : outcome.stderr();
  if (outcome.timed_out()) {
    diagnostics = "Compilation timed out\n" + diagnostics;
  } else if (outcome.memory_exceeded()) {
    diagnostics = "Compilation exceeded the memory limit\n" + diagnostics;
  }
  record.set_succeeded(!outcome.timed_out() && !outcome.memory_exceeded() &&
                       outcome.exit_code() == 0);
  record.set_diagnostics(diagnostics);
  LOG(INFO) << "Compilation of " << spec_.source_file
            << (record.succeeded() ? " succeeded" : " failed");
  return record;
}

}  // namespace

// static
std::unique_ptr<LanguageRunner> LanguageRunner::Create(
    proto::Language language) {
  const LanguageSpec* spec = GetLanguageSpec(language);
  if (spec == nullptr) {
    throw std::domain_error("Unsupported language: " +
                            proto::Language_Name(language));
  }
  if (spec->compiled) return absl::make_unique<CompiledRunner>(*spec);
  return absl::make_unique<NotCompiledRunner>(*spec);
}

std::pair<std::string, std::string> LanguageRunner::PrepareSource(
    const std::string& code) const {
  if (spec_.language == proto::JAVA) {
    return {spec_.source_file, WrapJavaMain(code)};
  }
  return {spec_.source_file, code};
}

std::string WrapWithStdin(proto::Language language, const std::string& code,
                          const std::string& stdin) {
  // The input goes through base64, so that the generated source is valid
  // whatever the input contains.
  std::string encoded = absl::Base64Escape(stdin);
  switch (language) {
    case proto::PYTHON:
      return absl::Substitute(kPythonWrapper, encoded, code);
    case proto::JAVASCRIPT:
      return absl::Substitute(kJavaScriptWrapper, encoded, code);
    default:
      throw std::domain_error("No input wrapper for " +
                              proto::Language_Name(language));
  }
}

std::string WrapJavaMain(const std::string& code) {
  if (absl::StrContains(code, "class Main")) return code;
  return absl::Substitute(kJavaWrapper, code);
}

}  // namespace manager
