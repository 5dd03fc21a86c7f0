#include "sandbox/resource_monitor.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/process_tree.hpp"

namespace {

using namespace sandbox;  // NOLINT

const std::string test_dir = SANDBOX_TEST_DIR;
const std::chrono::milliseconds kInterval(20);

// Starts a test program in a new session, as the sandbox does.
pid_t Spawn(const std::string& program, std::vector<std::string> args) {
  std::string path = test_dir + "/" + program;
  args.insert(args.begin(), path);
  std::vector<char*> argv;
  for (std::string& arg : args) argv.push_back(&arg[0]);
  argv.push_back(nullptr);
  pid_t pid = fork();
  if (pid == 0) {
    setsid();
    execv(path.c_str(), argv.data());
    _exit(127);
  }
  return pid;
}

void Reap(pid_t pid) {
  TerminateProcessTree(pid, std::chrono::milliseconds(0));
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(ResourceMonitorTest, SampleOfMissingProcessIsZero) {
  pid_t pid = Spawn("return_arg1", {"0"});
  ASSERT_GT(pid, 0);
  waitpid(pid, nullptr, 0);
  EXPECT_EQ(ResourceMonitor::Sample(pid), 0);
}

// NOLINTNEXTLINE
TEST(ResourceMonitorTest, SampleIncludesChildren) {
  pid_t pid = Spawn("fork_malloc_arg1", {"3", "16", "2"});
  ASSERT_GT(pid, 0);
  int64_t memory_kb = 0;
  for (int i = 0; i < 100 && memory_kb < 48 * 1024; i++) {
    std::this_thread::sleep_for(kInterval);
    memory_kb = ResourceMonitor::Sample(pid);
  }
  EXPECT_GE(memory_kb, 48 * 1024);
  Reap(pid);
}

// NOLINTNEXTLINE
TEST(ResourceMonitorTest, StopsWhenTheProcessExits) {
  auto start = std::chrono::steady_clock::now();
  pid_t pid = Spawn("wait_arg1", {"0.1"});
  ASSERT_GT(pid, 0);
  ResourceMonitor monitor(pid, 0, 0, kInterval, start);
  ResourceSample sample;
  int64_t last_elapsed_millis = 0;
  int samples = 0;
  while (monitor.Next(&sample)) {
    last_elapsed_millis = sample.elapsed_millis;
    samples++;
  }
  EXPECT_EQ(monitor.Result(), ResourceMonitor::EXITED);
  EXPECT_GE(samples, 2);
  EXPECT_GE(last_elapsed_millis, 60);
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(ResourceMonitorTest, TimeLimit) {
  auto start = std::chrono::steady_clock::now();
  pid_t pid = Spawn("wait_arg1", {"10"});
  ASSERT_GT(pid, 0);
  ResourceMonitor monitor(pid, 100, 0, kInterval, start);
  ResourceSample sample;
  ResourceSample last;
  while (monitor.Next(&sample)) last = sample;
  EXPECT_EQ(monitor.Result(), ResourceMonitor::TIME_LIMIT);
  EXPECT_GE(last.elapsed_millis, 100);
  EXPECT_LE(last.elapsed_millis, 200);
  Reap(pid);
}

// NOLINTNEXTLINE
TEST(ResourceMonitorTest, MemoryLimit) {
  auto start = std::chrono::steady_clock::now();
  pid_t pid = Spawn("malloc_arg1", {"64", "5"});
  ASSERT_GT(pid, 0);
  ResourceMonitor monitor(pid, 0, 16 * 1024, kInterval, start);
  ResourceSample sample;
  ResourceSample last;
  while (monitor.Next(&sample)) last = sample;
  EXPECT_EQ(monitor.Result(), ResourceMonitor::MEMORY_LIMIT);
  EXPECT_GT(last.memory_kb, 16 * 1024);
  EXPECT_EQ(monitor.MaxMemoryKb(), last.memory_kb);
  Reap(pid);
}

// NOLINTNEXTLINE
TEST(ResourceMonitorTest, Cancel) {
  auto start = std::chrono::steady_clock::now();
  pid_t pid = Spawn("wait_arg1", {"10"});
  ASSERT_GT(pid, 0);
  ResourceMonitor monitor(pid, 0, 0, std::chrono::milliseconds(1000), start);
  std::thread canceller([&monitor]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    monitor.Cancel();
  });
  ResourceSample sample;
  while (monitor.Next(&sample)) {
  }
  canceller.join();
  EXPECT_EQ(monitor.Result(), ResourceMonitor::CANCELLED);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(900));
  Reap(pid);
}

// NOLINTNEXTLINE
TEST(ProcessTreeTest, TerminateKillsTheWholeTree) {
  pid_t pid = Spawn("fork_malloc_arg1", {"3", "1", "10"});
  ASSERT_GT(pid, 0);
  for (int i = 0; i < 100 && ListProcessTree(pid).size() < 4; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(ListProcessTree(pid).size(), 4);
  EXPECT_TRUE(TerminateProcessTree(pid, std::chrono::milliseconds(200)));
  EXPECT_TRUE(ListProcessTree(pid).empty());
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(ProcessTreeTest, NoTreeForInvalidRoot) {
  EXPECT_TRUE(ListProcessTree(0).empty());
  EXPECT_TRUE(ListProcessTree(1).empty());
}

}  // namespace
