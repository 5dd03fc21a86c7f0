#include "executor/local_environment.hpp"

#include <signal.h>
#include <unistd.h>

#include <stdexcept>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

using executor::CommandResult;
using executor::Environment;
using executor::LocalEnvironment;
using executor::LocalEnvironmentFactory;

const std::string test_tmpdir = "/tmp/code_runner_testdir/environment";

// NOLINTNEXTLINE
TEST(LocalEnvironmentTest, WriteAndRun) {
  LocalEnvironment env(test_tmpdir);
  env.WriteFile("stdin.txt", "some input\n");
  EXPECT_EQ(util::File::Contents(env.Root() + "/stdin.txt"), "some input\n");
  CommandResult result = env.RunCommand({"cat"}, "stdin.txt", nullptr);
  EXPECT_EQ(result.output, "some input\n");
  EXPECT_EQ(result.error_output, "");
  EXPECT_EQ(result.exit_code, 0);
}

// NOLINTNEXTLINE
TEST(LocalEnvironmentTest, RunsInRoot) {
  LocalEnvironment env(test_tmpdir);
  env.WriteFile("data.txt", "x");
  CommandResult result =
      env.RunCommand({"sh", "-c", "ls; echo oops >&2; exit 3"}, "", nullptr);
  EXPECT_EQ(result.output, "data.txt\n");
  EXPECT_EQ(result.error_output, "oops\n");
  EXPECT_EQ(result.exit_code, 3);
}

// NOLINTNEXTLINE
TEST(LocalEnvironmentTest, SignalExitCode) {
  LocalEnvironment env(test_tmpdir);
  CommandResult result =
      env.RunCommand({"sh", "-c", "kill -9 $$"}, "", nullptr);
  EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}

// NOLINTNEXTLINE
TEST(LocalEnvironmentTest, InvalidFileName) {
  LocalEnvironment env(test_tmpdir);
  EXPECT_THROW(env.WriteFile("../escape", "x"), std::runtime_error);
  EXPECT_THROW(env.WriteFile("", "x"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(LocalEnvironmentTest, MissingCommand) {
  LocalEnvironment env(test_tmpdir);
  try {
    env.RunCommand({"surely-not-a-command"}, "", nullptr);
    FAIL() << "RunCommand did not throw";
  } catch (const std::runtime_error& exc) {
    EXPECT_THAT(exc.what(), HasSubstr("command not found"));
  }
}

// NOLINTNEXTLINE
TEST(LocalEnvironmentTest, Destroy) {
  LocalEnvironmentFactory factory(test_tmpdir);
  std::unique_ptr<Environment> env = factory.Create();
  std::string root = env->Root();
  env->WriteFile("a.txt", "x");
  EXPECT_EQ(access((root + "/a.txt").c_str(), F_OK), 0);
  env->Destroy();
  EXPECT_EQ(access(root.c_str(), F_OK), -1);
  env->Destroy();
  EXPECT_THROW(env->WriteFile("a.txt", "x"), std::logic_error);
}

}  // namespace
