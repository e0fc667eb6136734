#include "sandbox/safety_guard.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/resource.h>
#include <unistd.h>

#if defined(__linux__)
#include <linux/seccomp.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#endif

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Writes "prefix: strerror(err)" to error_msg without allocating.
void FormatError(const char* prefix, int err, char* error_msg, size_t buflen) {
  if (buflen == 0) return;
  char buf[256] = {};
  error_msg[0] = 0;
  strncat(error_msg, prefix, buflen - 1);
  strncat(error_msg, ": ", buflen - 1 - strlen(error_msg));
  strncat(error_msg, mystrerror(err, buf, sizeof(buf)),
          buflen - 1 - strlen(error_msg));
}

// Lowers the given limit to value, or to the current hard limit if that is
// smaller. Unprivileged processes can not raise hard limits.
bool SetLimit(int resource, rlim_t soft, rlim_t hard, const char* name,
              char* error_msg, size_t buflen) {
  struct rlimit rlim {};
  if (getrlimit(resource, &rlim) == -1) {
    FormatError(name, errno, error_msg, buflen);
    return false;
  }
  if (rlim.rlim_max != RLIM_INFINITY) {
    if (hard > rlim.rlim_max) hard = rlim.rlim_max;
    if (soft > hard) soft = hard;
  }
  rlim.rlim_cur = soft;
  rlim.rlim_max = hard;
  if (setrlimit(resource, &rlim) == -1) {
    FormatError(name, errno, error_msg, buflen);
    return false;
  }
  return true;
}

#if defined(__linux__)
// Syscalls that never have a reason to be used by a program under test.
const char* const kPrivilegedSyscalls[] = {
    "ptrace",      "reboot",      "mount",         "umount2",
    "pivot_root",  "chroot",      "setuid",        "setgid",
    "setreuid",    "setregid",    "setresuid",     "setresgid",
    "swapon",      "swapoff",     "kexec_load",    "init_module",
    "finit_module", "delete_module", "unshare",    "setns",
};

const char* const kFilesystemSyscalls[] = {
    "unlink",   "unlinkat", "rename",     "renameat",    "renameat2",
    "chmod",    "fchmod",   "fchmodat",   "fchmodat2",   "chown",
    "lchown",   "fchown",   "fchownat",   "truncate",    "truncate64",
    "ftruncate", "ftruncate64",
};

const char* const kProcessSyscalls[] = {
    "fork",
    "vfork",
    "pidfd_send_signal",
};

// Signal syscalls whose first argument is the target process.
const char* const kSignalSyscalls[] = {
    "kill", "tkill", "tgkill", "rt_sigqueueinfo", "rt_tgsigqueueinfo",
};

struct scmp_arg_cmp Arg0(enum scmp_compare op, scmp_datum_t a,
                         scmp_datum_t b = 0) {
  struct scmp_arg_cmp cmp = {0, op, a, b};
  return cmp;
}

// Adds a rule for the syscall called name. Syscalls that do not exist on
// this architecture are skipped.
int AddRule(scmp_filter_ctx ctx, uint32_t action, const char* name,
            const struct scmp_arg_cmp* arg = nullptr) {
  int nr = seccomp_syscall_resolve_name(name);
  if (nr < 0) return 0;
  return seccomp_rule_add_array(ctx, action, nr, arg ? 1 : 0, arg);
}

int AddRules(scmp_filter_ctx ctx, const sandbox::GuardOptions& options,
             pid_t pid) {
  int err = 0;
#ifdef SCMP_ACT_KILL_PROCESS
  err = seccomp_attr_set(ctx, SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_KILL_PROCESS);
#endif
  auto add = [&err, ctx](uint32_t action, const char* name,
                         const struct scmp_arg_cmp* arg) {
    if (!err) err = AddRule(ctx, action, name, arg);
  };

  for (const char* name : kPrivilegedSyscalls) {
    add(SCMP_ACT_ERRNO(EPERM), name, nullptr);
  }

  if (options.deny_filesystem_changes) {
    for (const char* name : kFilesystemSyscalls) {
      add(SCMP_ACT_ERRNO(EPERM), name, nullptr);
    }
  }

  if (options.deny_process_creation) {
    for (const char* name : kProcessSyscalls) {
      add(SCMP_ACT_ERRNO(EPERM), name, nullptr);
    }
    // clone3 arguments live in memory and can not be inspected. The C library
    // falls back to clone when it is not available.
    add(SCMP_ACT_ERRNO(ENOSYS), "clone3", nullptr);
    // clone is allowed only to create threads.
    struct scmp_arg_cmp not_thread =
        Arg0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0);
    add(SCMP_ACT_ERRNO(EPERM), "clone", &not_thread);
  }

  if (options.deny_foreign_signals) {
    struct scmp_arg_cmp other_process = Arg0(SCMP_CMP_NE, pid);
    for (const char* name : kSignalSyscalls) {
      add(SCMP_ACT_ERRNO(EPERM), name, &other_process);
    }
  }
  return err;
}
#endif

}  // namespace

namespace sandbox {

SafetyGuard::SafetyGuard(const GuardOptions& options) : options_(options) {
  enforced_ = HostCapabilities();
  if (!options_.deny_filesystem_changes && !options_.deny_process_creation &&
      !options_.deny_foreign_signals) {
    enforced_.syscall_filter = false;
  }
}

SafetyGuard::~SafetyGuard() { CloseChannel(); }

void SafetyGuard::CloseChannel() {
  for (int* fd : {&filter_fd_, &ready_fds_[0], &ready_fds_[1]}) {
    if (*fd != -1) close(*fd);
    *fd = -1;
  }
}

const Capabilities& SafetyGuard::HostCapabilities() {
  static const Capabilities capabilities = [] {
    Capabilities caps;
#if defined(__unix__) || defined(__APPLE__)
    caps.resource_limits = true;
#endif
    // Setting stack size does not seem to work on MAC.
#if defined(__unix__) && !defined(__APPLE__)
    caps.stack_limit = true;
#endif
#if defined(__linux__)
    caps.syscall_filter = prctl(PR_GET_SECCOMP, 0, 0, 0, 0) != -1;
#endif
    return caps;
  }();
  return capabilities;
}

bool SafetyGuard::Install(char* error_msg, size_t buflen) {
  if (enforced_.resource_limits && !SetLimits(error_msg, buflen)) return false;
  if (enforced_.syscall_filter && !InstallFilter(error_msg, buflen)) {
    return false;
  }
  return true;
}

bool SafetyGuard::SetLimits(char* error_msg, size_t buflen) {
#define SET_RLIM(res, soft, hard)                                         \
  if (!SetLimit(RLIMIT_##res, soft, hard, "setrlim " #res, error_msg, \
                buflen)) {                                                \
    return false;                                                         \
  }

  SET_RLIM(CORE, 0, 0);
  if (options_.memory_limit_kb) {
    rlim_t bytes = options_.memory_limit_kb * 1024;
    SET_RLIM(AS, bytes, bytes);
  }
  if (options_.cpu_limit_millis) {
    // The soft limit sends SIGXCPU, the hard one SIGKILL.
    rlim_t seconds = (options_.cpu_limit_millis + 999) / 1000;
    SET_RLIM(CPU, seconds, seconds + 1);
  }
  if (options_.max_file_size_kb) {
    rlim_t bytes = options_.max_file_size_kb * 1024;
    SET_RLIM(FSIZE, bytes, bytes);
  }
  if (options_.max_files) {
    SET_RLIM(NOFILE, options_.max_files, options_.max_files);
  }
  if (enforced_.stack_limit && options_.max_stack_kb) {
    rlim_t bytes = options_.max_stack_kb * 1024;
    SET_RLIM(STACK, bytes, bytes);
  }
#undef SET_RLIM
  return true;
}

#if defined(__linux__)

bool SafetyGuard::Prepare(std::string* error_msg) {
  if (!enforced_.syscall_filter) return true;
  char buf[256] = {};
  filter_.resize(BPF_MAXINSNS);
  filter_fd_ = memfd_create("evalbox-filter", MFD_CLOEXEC);
  if (filter_fd_ == -1) {
    *error_msg = "memfd_create: ";
    *error_msg += mystrerror(errno, buf, sizeof(buf));
    return false;
  }
  if (pipe2(ready_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, sizeof(buf));
    CloseChannel();
    return false;
  }
  return true;
}

bool SafetyGuard::ExportFilter(pid_t pid, std::string* error_msg) {
  if (!enforced_.syscall_filter) return true;
  char buf[256] = {};
  scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
  if (ctx == nullptr) {
    *error_msg = "seccomp_init failed";
    return false;
  }
  int err = AddRules(ctx, options_, pid);
  if (!err) err = seccomp_export_bpf(ctx, filter_fd_);
  seccomp_release(ctx);
  if (err) {
    *error_msg = "seccomp: ";
    *error_msg += mystrerror(-err, buf, sizeof(buf));
    return false;
  }
  // The read end is still open here, so the write can not raise SIGPIPE.
  char ready = 1;
  ssize_t written = 0;
  do {
    written = write(ready_fds_[1], &ready, 1);
  } while (written == -1 && errno == EINTR);
  if (written != 1) {
    *error_msg = "write: ";
    *error_msg += mystrerror(errno, buf, sizeof(buf));
    return false;
  }
  CloseChannel();
  return true;
}

bool SafetyGuard::InstallFilter(char* error_msg, size_t buflen) {
  close(ready_fds_[1]);
  char ready = 0;
  ssize_t got = 0;
  do {
    got = read(ready_fds_[0], &ready, 1);
  } while (got == -1 && errno == EINTR);
  if (got != 1) {
    FormatError("filter", got == -1 ? errno : ECANCELED, error_msg, buflen);
    return false;
  }

  struct stat st {};
  if (fstat(filter_fd_, &st) == -1) {
    FormatError("fstat", errno, error_msg, buflen);
    return false;
  }
  size_t size = st.st_size;
  if (size == 0 || size % sizeof(struct sock_filter) != 0 ||
      size > filter_.size() * sizeof(struct sock_filter)) {
    FormatError("filter", EINVAL, error_msg, buflen);
    return false;
  }
  char* data = reinterpret_cast<char*>(filter_.data());
  size_t done = 0;
  while (done < size) {
    ssize_t ret = pread(filter_fd_, data + done, size - done, done);
    if (ret == -1 && errno == EINTR) continue;
    if (ret <= 0) {
      FormatError("pread", ret == -1 ? errno : EIO, error_msg, buflen);
      return false;
    }
    done += ret;
  }

  struct sock_fprog prog = {
      static_cast<unsigned short>(size / sizeof(struct sock_filter)),
      filter_.data(),
  };
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    FormatError("prctl", errno, error_msg, buflen);
    return false;
  }
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == -1) {
    FormatError("seccomp", errno, error_msg, buflen);
    return false;
  }
  return true;
}

#else

bool SafetyGuard::Prepare(std::string* error_msg) { return true; }

bool SafetyGuard::ExportFilter(pid_t pid, std::string* error_msg) {
  return true;
}

bool SafetyGuard::InstallFilter(char* error_msg, size_t buflen) {
  FormatError("seccomp", ENOSYS, error_msg, buflen);
  return false;
}

#endif

}  // namespace sandbox
