#include "sandbox/process_tree.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "glog/logging.h"

namespace {

// Time allowed for the kernel to reap a SIGKILLed tree.
const constexpr auto kKillTimeout = std::chrono::milliseconds(1000);
const constexpr auto kTerminationPoll = std::chrono::milliseconds(5);

// Reads a small /proc file. Returns false if it cannot be opened or read.
bool ReadProcFile(const std::string& path, std::string* contents) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char buf[4096];
  contents->clear();
  ssize_t cur = 0;
  do {
    cur = read(fd, buf, sizeof(buf));
    if (cur == -1 && errno == EINTR) continue;
    if (cur < 0) {
      close(fd);
      return false;
    }
    contents->append(buf, cur);
  } while (cur > 0);
  close(fd);
  return true;
}

std::vector<pid_t> ListPids() {
  std::vector<pid_t> pids;
  DIR* proc = opendir("/proc");
  if (proc == nullptr) return pids;
  while (struct dirent* entry = readdir(proc)) {
    char* end = nullptr;
    long pid = strtol(entry->d_name, &end, 10);
    if (*end != '\0' || pid <= 0) continue;
    pids.push_back(static_cast<pid_t>(pid));
  }
  closedir(proc);
  return pids;
}

}  // namespace

namespace sandbox {

bool ReadProcessStat(pid_t pid, ProcessStat* stat) {
  std::string contents;
  if (!ReadProcFile("/proc/" + std::to_string(pid) + "/stat", &contents))
    return false;
  // The command name is enclosed in parentheses and may contain spaces and
  // parentheses itself, so parsing starts after the last ')'.
  size_t comm_end = contents.rfind(')');
  if (comm_end == std::string::npos) return false;
  int ppid = 0;
  int pgrp = 0;
  int session = 0;
  char state = '?';
  if (sscanf(contents.c_str() + comm_end + 1, " %c %d %d %d", &state, &ppid,
             &pgrp, &session) != 4) {
    return false;
  }
  stat->pid = pid;
  stat->state = state;
  stat->ppid = ppid;
  stat->pgrp = pgrp;
  stat->session = session;
  return true;
}

bool BecomeSubreaper() {
  if (prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) == -1) {
    PLOG(WARNING) << "prctl(PR_SET_CHILD_SUBREAPER)";
    return false;
  }
  return true;
}

std::vector<pid_t> ListProcessTree(pid_t root, pid_t reaper) {
  if (root <= 1) return {};
  std::unordered_map<pid_t, std::vector<pid_t>> children;
  std::vector<pid_t> tree;
  std::unordered_set<pid_t> in_tree;
  for (pid_t pid : ListPids()) {
    ProcessStat stat;
    if (!ReadProcessStat(pid, &stat)) continue;
    if (stat.state == 'Z' || stat.state == 'X') continue;
    children[stat.ppid].push_back(pid);
    if (stat.session == root && in_tree.insert(pid).second) tree.push_back(pid);
  }
  if (reaper > 0) {
    for (pid_t orphan : children[reaper]) {
      if (in_tree.insert(orphan).second) tree.push_back(orphan);
    }
  }
  std::sort(tree.begin(), tree.end());
  for (size_t i = 0; i < tree.size(); i++) {
    for (pid_t child : children[tree[i]]) {
      if (in_tree.insert(child).second) tree.push_back(child);
    }
  }
  return tree;
}

int64_t ResidentMemoryKb(pid_t pid) {
  std::string contents;
  if (!ReadProcFile("/proc/" + std::to_string(pid) + "/statm", &contents))
    return 0;
  long long size = 0;
  long long resident = 0;
  if (sscanf(contents.c_str(), "%lld %lld", &size, &resident) != 2) return 0;
  static const long page_kb = sysconf(_SC_PAGESIZE) / 1024;
  return resident * page_kb;
}

void ReapOrphans(pid_t root) {
  const pid_t self = getpid();
  for (pid_t pid : ListPids()) {
    ProcessStat stat;
    if (pid == root || !ReadProcessStat(pid, &stat)) continue;
    if (stat.ppid != self || stat.state != 'Z') continue;
    if (waitpid(pid, nullptr, WNOHANG) == -1 && errno != ECHILD) {
      PLOG(WARNING) << "waitpid(" << pid << ")";
    }
  }
}

int64_t ProcessTreeMemoryKb(pid_t root, pid_t reaper) {
  int64_t total = 0;
  for (pid_t pid : ListProcessTree(root, reaper)) {
    total += ResidentMemoryKb(pid);
  }
  return total;
}

void SignalProcessTree(pid_t root, int sig, pid_t reaper) {
  if (root <= 1) return;
  // The group may already be empty.
  kill(-root, sig);
  for (pid_t pid : ListProcessTree(root, reaper)) {
    if (kill(pid, sig) == -1 && errno != ESRCH) {
      PLOG(WARNING) << "kill(" << pid << ", " << sig << ")";
    }
  }
}

bool TerminateProcessTree(pid_t root, std::chrono::milliseconds grace,
                          pid_t reaper) {
  auto wait_empty = [root, reaper](std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!ListProcessTree(root, reaper).empty()) {
      if (std::chrono::steady_clock::now() >= deadline) return false;
      std::this_thread::sleep_for(kTerminationPoll);
    }
    return true;
  };

  if (grace.count() > 0) {
    SignalProcessTree(root, SIGTERM, reaper);
    if (wait_empty(grace)) return true;
    VLOG(1) << "Process tree " << root << " survived SIGTERM";
  }
  SignalProcessTree(root, SIGKILL, reaper);
  if (wait_empty(kKillTimeout)) return true;
  // Processes forked between the listing and the kill are caught here.
  SignalProcessTree(root, SIGKILL, reaper);
  if (wait_empty(kKillTimeout)) return true;
  LOG(ERROR) << "Could not terminate the process tree of " << root;
  return false;
}

}  // namespace sandbox
