#include "sandbox/unix.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <system_error>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"
#include "sandbox/process_tree.hpp"
#include "sandbox/resource_monitor.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// How an execution ended. Decided by whichever of the exit waiter and the
// resource watcher reports first.
enum Ending { EXITED, TIME_LIMIT, MEMORY_LIMIT, STOPPED };

int64_t MillisSince(std::chrono::steady_clock::time_point start,
                    std::chrono::steady_clock::time_point end) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
      .count();
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  arg_storage_.clear();
  argv_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  // Descendants that detach from the tree are reparented to this process, so
  // that they can still be found and killed.
  static const bool is_subreaper = BecomeSubreaper();
  reaper_ = is_subreaper ? getpid() : 0;

  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  start_ = std::chrono::steady_clock::now();
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  } else {
    Child();
  }
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      (void)!write(pipe_fds_[1], buf, len);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session: the child and everything it spawns can be found (and
  // killed) through the session id, and we do not receive Ctrl-Cs from the
  // terminal.
  if (setsid() == -1) die("setsid", errno);

  // The supervisor may block or ignore signals; the program gets the
  // defaults.
  sigset_t empty_set;
  sigemptyset(&empty_set);
  if (sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1)
    die("sigprocmask", errno);
  struct sigaction default_action {};
  default_action.sa_handler = SIG_DFL;
  sigaction(SIGPIPE, &default_action, nullptr);
  sigaction(SIGINT, &default_action, nullptr);
  sigaction(SIGTERM, &default_action, nullptr);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY);
  } else {
    stdin_fd = open("/dev/null", O_RDONLY);
  }
  if (stdin_fd == -1) die("open", errno);
  if (!options_->stdout_file.empty()) {
    stdout_fd = creat(options_->stdout_file.c_str(), S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("creat", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = creat(options_->stderr_file.c_str(), S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("creat", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  int count = 0;
  do {
    execv(options_->executable.c_str(), argv_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);
  // The pipe is closed on exec, so this read returns 0 once the program is
  // running, or the error reported by the child.
  int error_len = 0;
  ssize_t got = 0;
  do {
    got = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (got == -1 && errno == EINTR);
  if (got == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    size_t to_read = std::min<size_t>(std::max(error_len, 0), PIPE_BUF - 1);
    if (read(pipe_fds_[0], error, to_read) == -1) {
      *error_msg = "read: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    } else {
      *error_msg = error;
    }
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(pipe_fds_[0]);

  std::promise<Ending> ending;
  std::future<Ending> first_ending = ending.get_future();
  std::atomic<bool> resolved{false};
  auto resolve = [&ending, &resolved](Ending how) {
    if (!resolved.exchange(true)) ending.set_value(how);
  };

  int child_status = 0;
  int wait_error = 0;
  struct rusage rusage {};
  std::thread waiter;
  try {
    waiter = std::thread([this, &child_status, &wait_error, &rusage,
                          &resolve]() {
      pid_t ret = 0;
      do {
        ret = wait4(child_pid_, &child_status, 0, &rusage);
      } while (ret == -1 && errno == EINTR);
      if (ret == -1) wait_error = errno;
      resolve(EXITED);
    });
  } catch (const std::system_error& exc) {
    TerminateProcessTree(child_pid_, std::chrono::milliseconds(0), reaper_);
    waitpid(child_pid_, nullptr, 0);
    ReapOrphans(child_pid_);
    *error_msg = std::string("thread: ") + exc.what();
    return false;
  }

  ResourceMonitor monitor(
      child_pid_, options_->wall_limit_millis, options_->memory_limit_kb,
      std::chrono::milliseconds(
          std::max<int64_t>(1, options_->poll_interval_millis)),
      start_, reaper_);
  std::thread watcher;
  try {
    watcher = std::thread([this, &monitor, &resolve]() {
      ResourceSample sample;
      while (monitor.Next(&sample)) {
        if (options_->stop != nullptr && options_->stop->load()) {
          resolve(STOPPED);
          return;
        }
      }
      if (monitor.Result() == ResourceMonitor::TIME_LIMIT) resolve(TIME_LIMIT);
      if (monitor.Result() == ResourceMonitor::MEMORY_LIMIT)
        resolve(MEMORY_LIMIT);
    });
  } catch (const std::system_error& exc) {
    TerminateProcessTree(child_pid_, std::chrono::milliseconds(0), reaper_);
    waiter.join();
    ReapOrphans(child_pid_);
    *error_msg = std::string("thread: ") + exc.what();
    return false;
  }

  Ending how = first_ending.get();
  auto end = std::chrono::steady_clock::now();
  std::chrono::milliseconds grace(std::min<int64_t>(
      1000, std::max<int64_t>(0, options_->kill_grace_millis)));

  bool terminated = true;
  if (how != EXITED) {
    VLOG(1) << "Killing process tree of " << child_pid_;
    terminated = TerminateProcessTree(child_pid_, grace, reaper_);
  }
  waiter.join();
  monitor.Cancel();
  watcher.join();

  // Background processes left behind by a program that exited on its own.
  if (!ListProcessTree(child_pid_, reaper_).empty()) {
    LOG(INFO) << "Process " << child_pid_ << " left running descendants";
    terminated = TerminateProcessTree(child_pid_, grace, reaper_) && terminated;
  }
  ReapOrphans(child_pid_);

  if (wait_error != 0) {
    *error_msg = "wait4: ";
    *error_msg += mystrerror(wait_error, buf, kStrErrorBufSize);
    return false;
  }

  info->wall_time_millis = MillisSince(start_, end);
  info->memory_usage_kb =
      std::max<int64_t>(monitor.MaxMemoryKb(), rusage.ru_maxrss);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  info->timed_out = how == TIME_LIMIT;
  info->memory_exceeded = how == MEMORY_LIMIT;
  info->stopped = how == STOPPED;
  info->tree_terminated = terminated;
  if (!terminated) {
    info->message = "could not confirm the termination of all the processes";
  }
  return true;
}

}  // namespace sandbox
