#include "manager/language.hpp"

namespace manager {

const std::vector<LanguageSpec>& SupportedLanguages() {
  static const std::vector<LanguageSpec>* languages =
      new std::vector<LanguageSpec>{
          {proto::C, true, "code.c",
           {"cc", "-std=c11", "-O2", "-o", "main", "code.c", "-lm"},
           {"./main"},
           StdinStrategy::NONE},
          {proto::CPP, true, "code.cpp",
           {"c++", "-std=c++17", "-O2", "-o", "main", "code.cpp"},
           {"./main"},
           StdinStrategy::NONE},
          {proto::RUST, true, "code.rs",
           {"rustc", "-O", "-o", "main", "code.rs"},
           {"./main"},
           StdinStrategy::NONE},
          {proto::JAVA, true, "Main.java",
           {"javac", "Main.java"},
           {"java", "-cp", ".", "Main"},
           StdinStrategy::NONE},
          {proto::PYTHON, false, "code.py",
           {},
           {"python3", "code.py"},
           StdinStrategy::INLINE_WRAPPER},
          {proto::JAVASCRIPT, false, "code.js",
           {},
           {"node", "code.js"},
           StdinStrategy::INLINE_WRAPPER},
          {proto::SHELL, false, "code.sh",
           {},
           {"sh", "code.sh"},
           StdinStrategy::NONE},
      };
  return *languages;
}

const LanguageSpec* GetLanguageSpec(proto::Language language) {
  for (const LanguageSpec& spec : SupportedLanguages()) {
    if (spec.language == language) return &spec;
  }
  return nullptr;
}

}  // namespace manager
