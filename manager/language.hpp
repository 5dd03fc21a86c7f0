#ifndef MANAGER_LANGUAGE_HPP
#define MANAGER_LANGUAGE_HPP

#include <string>
#include <vector>

#include "proto/execution.pb.h"

namespace manager {

// How the input of a test case reaches the program.
enum class StdinStrategy {
  // Through the standard input of the process.
  NONE,
  // Embedded in the source, which is rewritten before every test case.
  INLINE_WRAPPER
};

// Fixed description of how a language is built and run. Compiled languages
// always read their input from the standard input.
struct LanguageSpec {
  proto::Language language;
  bool compiled;
  std::string source_file;
  // Empty for languages that are not compiled.
  std::vector<std::string> compile_command;
  std::vector<std::string> execute_command;
  StdinStrategy stdin_strategy;
};

// Returns the spec of language, or nullptr if the language is not supported.
const LanguageSpec* GetLanguageSpec(proto::Language language);

// Every supported language.
const std::vector<LanguageSpec>& SupportedLanguages();

}  // namespace manager

#endif
