#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/process_tree.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace {

using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

const std::string test_dir = SANDBOX_TEST_DIR;

ExecutionOptions TestProgram(const std::string& name) {
  return ExecutionOptions(test_dir, test_dir + "/" + name);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("foo", "bar");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("foo");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestReturnArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("return_arg1");
  options.args.push_back("15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.timed_out);
  EXPECT_FALSE(info.memory_exceeded);
  EXPECT_TRUE(info.tree_terminated);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignalArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("signal_arg1");
  options.args.push_back("6");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestRedirection) {
  util::TempDir tmp("/tmp/code_runner_testdir/unix");
  util::File::Write(tmp.Path() + "/stdin.txt", "ciao\n");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(tmp.Path(), "/bin/cat");
  options.stdin_file = tmp.Path() + "/stdin.txt";
  options.stdout_file = tmp.Path() + "/stdout.txt";
  options.stderr_file = tmp.Path() + "/stderr.txt";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Contents(tmp.Path() + "/stdout.txt"), "ciao\n");
  EXPECT_EQ(util::File::Contents(tmp.Path() + "/stderr.txt"), "");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("wait_arg1");
  options.args.push_back("0.1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 300);
  EXPECT_LE(info.cpu_time_millis, 50);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestBusyWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("busywait_arg1");
  options.args.push_back("0.1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 90);
  EXPECT_GE(info.wall_time_millis, 90);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMallocArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("malloc_arg1");
  options.args.push_back("32");
  options.args.push_back("0.2");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.memory_usage_kb, 32 * 1024);
  EXPECT_LE(info.memory_usage_kb, 40 * 1024);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("malloc_arg1");
  options.args.push_back("16");
  options.args.push_back("0.1");
  options.memory_limit_kb = 64 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.memory_exceeded);
  EXPECT_FALSE(info.timed_out);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("malloc_arg1");
  options.args.push_back("64");
  options.args.push_back("5");
  options.memory_limit_kb = 16 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.memory_exceeded);
  EXPECT_FALSE(info.timed_out);
  EXPECT_GT(info.memory_usage_kb, 16 * 1024);
  EXPECT_NE(info.signal, 0);
  EXPECT_LT(info.wall_time_millis, 2000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryOfChildren) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("fork_malloc_arg1");
  options.args.push_back("4");
  options.args.push_back("16");
  options.args.push_back("5");
  options.memory_limit_kb = 40 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.memory_exceeded);
  EXPECT_GT(info.memory_usage_kb, 40 * 1024);
  EXPECT_TRUE(info.tree_terminated);
  EXPECT_LT(info.wall_time_millis, 2000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("wait_arg1");
  options.args.push_back("0.1");
  options.wall_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.timed_out);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("wait_arg1");
  options.args.push_back("10");
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.timed_out);
  EXPECT_FALSE(info.memory_exceeded);
  EXPECT_EQ(info.signal, SIGTERM);
  EXPECT_GE(info.wall_time_millis, 200);
  EXPECT_LE(info.wall_time_millis, 400);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestIgnoredTermIsKilled) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("ignore_term");
  options.wall_limit_millis = 100;
  options.kill_grace_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  auto took = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(info.timed_out);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.tree_terminated);
  EXPECT_LT(took, std::chrono::milliseconds(1500));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestStop) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  std::atomic<bool> stop{false};
  ExecutionOptions options = TestProgram("wait_arg1");
  options.args.push_back("10");
  options.stop = &stop;
  std::thread stopper([&stop]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    stop = true;
  });
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  stopper.join();
  EXPECT_TRUE(info.stopped);
  EXPECT_FALSE(info.timed_out);
  EXPECT_LT(info.wall_time_millis, 1000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestOrphansAreKilled) {
  util::TempDir tmp("/tmp/code_runner_testdir/unix");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("orphan_arg1");
  options.args.push_back("30");
  options.stdout_file = tmp.Path() + "/stdout.txt";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_TRUE(info.tree_terminated);
  pid_t orphan = std::stoi(util::File::Contents(tmp.Path() + "/stdout.txt"));
  ProcessStat stat;
  // The orphan is reparented to init (or a subreaper), which reaps it.
  bool alive = ReadProcessStat(orphan, &stat) && stat.state != 'Z';
  EXPECT_FALSE(alive);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestDetachedDescendantsAreKilled) {
  util::TempDir tmp("/tmp/code_runner_testdir/unix");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = TestProgram("escape_arg1");
  options.args.push_back("30");
  options.stdout_file = tmp.Path() + "/stdout.txt";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_TRUE(info.tree_terminated);
  pid_t detached = std::stoi(util::File::Contents(tmp.Path() + "/stdout.txt"));
  ProcessStat stat;
  // Reparented to this process, which kills and reaps it.
  EXPECT_FALSE(ReadProcessStat(detached, &stat));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestDetachedDescendantsAreKilledOnTimeout) {
  util::TempDir tmp("/tmp/code_runner_testdir/unix");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("/", "/bin/sh");
  options.args = {"-c", "\"" + test_dir + "/escape_arg1\" 30; sleep 10"};
  options.stdout_file = tmp.Path() + "/stdout.txt";
  options.wall_limit_millis = 300;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.timed_out);
  EXPECT_TRUE(info.tree_terminated);
  pid_t detached = std::stoi(util::File::Contents(tmp.Path() + "/stdout.txt"));
  ProcessStat stat;
  EXPECT_FALSE(ReadProcessStat(detached, &stat));
}

}  // namespace
