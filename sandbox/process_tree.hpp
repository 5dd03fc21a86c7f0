#ifndef SANDBOX_PROCESS_TREE_HPP
#define SANDBOX_PROCESS_TREE_HPP

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <vector>

namespace sandbox {

// Fields of /proc/<pid>/stat that are needed to rebuild a process tree.
struct ProcessStat {
  pid_t pid = 0;
  char state = '?';
  pid_t ppid = 0;
  pid_t pgrp = 0;
  pid_t session = 0;
};

// Reads /proc/<pid>/stat. Returns false if the process does not exist (any
// more), without distinguishing a process that exited between the listing of
// /proc and the read.
bool ReadProcessStat(pid_t pid, ProcessStat* stat);

// Marks the calling process as a child subreaper: descendants orphaned by
// their parent are reparented to it instead of init, and stay reachable from
// it even after they started a session of their own. Returns false if the
// kernel refuses.
bool BecomeSubreaper();

// Returns the live (non-zombie) processes of the tree rooted at root. The root
// is expected to have called setsid(), so the tree is every process of the
// session root, together with all their descendants (which catches children
// that started a session of their own while their parent is still alive).
// When reaper is not 0, its children other than root are part of the tree
// too: reaper is a subreaper that runs root as its only child, so they are
// orphans of the tree.
std::vector<pid_t> ListProcessTree(pid_t root, pid_t reaper = 0);

// Collects the exit status of the children of the calling process, other than
// root, that already terminated.
void ReapOrphans(pid_t root);

// Resident set size of a single process, in KB. Returns 0 if the process no
// longer exists.
int64_t ResidentMemoryKb(pid_t pid);

// Sum of the resident set size of every live process of the tree.
int64_t ProcessTreeMemoryKb(pid_t root, pid_t reaper = 0);

// Sends sig to the process group of root and to every process of its tree.
void SignalProcessTree(pid_t root, int sig, pid_t reaper = 0);

// Sends SIGTERM to the whole tree, waits at most grace for it to disappear,
// then sends SIGKILL. Returns true if no process of the tree is alive
// afterwards.
bool TerminateProcessTree(pid_t root, std::chrono::milliseconds grace,
                          pid_t reaper = 0);

}  // namespace sandbox

#endif
