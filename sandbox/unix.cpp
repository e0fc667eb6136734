#include "sandbox/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int64_t ToMillis(const struct timeval& tv) {
  return (int64_t)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr int kPollMillis = 10;

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
  guard_.reset(new SafetyGuard(options_->guard));
  if (!guard_->Prepare(error_msg)) return false;

  // Prepare args and environment: the child must not allocate memory.
  arg_storage_.clear();
  args_.clear();
  env_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (const std::string& var : options_->env) add_arg(var);
  size_t num_args = options_->args.size() + 1;
  for (size_t i = 0; i < arg_storage_.size(); i++) {
    (i < num_args ? args_ : env_).push_back(arg_storage_[i].data());
  }
  args_.push_back(nullptr);
  env_.push_back(nullptr);

#ifdef __APPLE__
  if (pipe(pipe_fds_) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
#else
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
#endif
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
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
    // The child waits for its syscall filter before running anything.
    if (!guard_->ExportFilter(child_pid_, error_msg)) {
      kill(child_pid_, SIGKILL);
      waitpid(child_pid_, nullptr, 0);
      close(pipe_fds_[0]);
      close(pipe_fds_[1]);
      return false;
    }
    return true;
  }
  Child();
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
      ssize_t unused = write(pipe_fds_[1], buf, len);
      (void)unused;
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change session, so that we do not receive Ctrl-Cs in the terminal and the
  // whole process group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  // Without an input file, stdin is opened write-only: reads fail with EBADF
  // instead of blocking.
  int stdin_fd = options_->stdin_file != ""
                     ? open(options_->stdin_file.c_str(), O_RDONLY)
                     : open("/dev/null", O_WRONLY);
  if (stdin_fd == -1) die("open", errno);
  auto open_output = [](const std::string& path) {
    if (path == "") return open("/dev/null", O_WRONLY);
    return creat(path.c_str(), S_IRUSR | S_IWUSR);
  };
  int stdout_fd = open_output(options_->stdout_file);
  if (stdout_fd == -1) die("creat", errno);
  int stderr_fd = open_output(options_->stderr_file);
  if (stderr_fd == -1) die("creat", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != fd) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
    close(field##_fd);                          \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  char buf[kStrErrorBufSize] = {};
  if (!guard_->Install(buf, kStrErrorBufSize)) {
    die2("guard", buf);
  }
  int count = 0;
  do {
    execve(options_->executable.c_str(), args_.data(), env_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillGroup() {
  // The group may already be empty.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH && errno != EPERM) {
    char buf[kStrErrorBufSize] = {};
    fprintf(stderr, "kill: %s\n", mystrerror(errno, buf, kStrErrorBufSize));
  }
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF + 1] = {};
    if (error_len > PIPE_BUF) error_len = PIPE_BUF;
    if (read(pipe_fds_[0], error, error_len) < 0) error[0] = 0;
    *error_msg = error;
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // The child is only reaped after its group has been killed: until then its
  // pid, and so the group id, can not be reused by another execution.
  // A wall limit of 0 means no limit.
  bool has_exited = false;
  while (!options_->wall_limit_millis ||
         elapsed_millis() < options_->wall_limit_millis) {
    siginfo_t siginfo {};
    int ret =
        waitid(P_PID, child_pid_, &siginfo, WEXITED | WNOHANG | WNOWAIT);
    if (ret == -1 && errno != EINTR) {
      *error_msg = "waitid: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      KillGroup();
      waitpid(child_pid_, nullptr, 0);
      return false;
    }
    if (ret == 0 && siginfo.si_pid == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollMillis));
  }
  if (!has_exited) {
    info->killed = true;
    kill(child_pid_, SIGKILL);
  }
  // Threads and processes that escaped the filter die with the program.
  KillGroup();

  // wait4 is used instead of waitpid since it also returns the resource usage
  // of the child.
  int child_status = 0;
  struct rusage rusage {};
  int ret = 0;
  do {
    ret = wait4(child_pid_, &child_status, 0, &rusage);
  } while (ret == -1 && errno == EINTR);
  if (ret != child_pid_) {
    *error_msg = "wait4: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }

  info->wall_time_millis = elapsed_millis();
#ifdef __APPLE__
  info->memory_usage_kb = rusage.ru_maxrss / 1024;
#else
  info->memory_usage_kb = rusage.ru_maxrss;
#endif
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
  return true;
}

}  // namespace sandbox
