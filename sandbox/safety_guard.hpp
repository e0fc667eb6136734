#ifndef SANDBOX_SAFETY_GUARD_HPP
#define SANDBOX_SAFETY_GUARD_HPP

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#if defined(__linux__)
#include <linux/filter.h>
#endif

namespace sandbox {

// Restrictions to apply to an untrusted program. A value of 0 for a limit
// means that the limit is left unchanged.
struct GuardOptions {
  int64_t memory_limit_kb = 0;
  int64_t cpu_limit_millis = 0;
  int64_t max_stack_kb = 0;
  int64_t max_file_size_kb = 0;
  int32_t max_files = 0;

  // Make unlink, rename, chmod, chown, truncate and friends fail with EPERM.
  bool deny_filesystem_changes = true;
  // Make fork, vfork and non-thread clones fail with EPERM.
  bool deny_process_creation = true;
  // Only allow signals directed to the program itself.
  bool deny_foreign_signals = true;
};

// Which restrictions can actually be enforced on this host.
struct Capabilities {
  bool resource_limits = false;
  bool stack_limit = false;
  bool syscall_filter = false;
};

// Set of restrictions installed in the process that is about to execute
// untrusted code. The guard is used in three steps:
//  - Prepare, in the parent before fork;
//  - ExportFilter, in the parent once the pid of the child is known. The
//    syscall filter is compiled with libseccomp and handed to the child;
//  - Install, in the child. It does not allocate memory, so it can be used
//    safely after fork in a multithreaded process.
// Restrictions that the host does not support are skipped: Enforced() tells
// which ones will actually be applied.
class SafetyGuard {
 public:
  explicit SafetyGuard(const GuardOptions& options);

  // Probes the capabilities of the host. The result is computed once.
  static const Capabilities& HostCapabilities();

  // Restrictions that Install will apply.
  const Capabilities& Enforced() const { return enforced_; }

  // Allocates what the child needs to receive the filter.
  bool Prepare(std::string* error_msg);

  // Compiles the filter for the process pid and releases the child waiting
  // in Install. On failure the child stays blocked and must be killed.
  bool ExportFilter(pid_t pid, std::string* error_msg);

  // Applies the restrictions to the calling process. Returns false and
  // writes a message of at most buflen characters to error_msg if a
  // supported restriction could not be installed.
  bool Install(char* error_msg, size_t buflen);

  SafetyGuard(const SafetyGuard&) = delete;
  SafetyGuard& operator=(const SafetyGuard&) = delete;
  SafetyGuard(SafetyGuard&&) = delete;
  SafetyGuard& operator=(SafetyGuard&&) = delete;
  ~SafetyGuard();

 private:
  bool SetLimits(char* error_msg, size_t buflen);
  bool InstallFilter(char* error_msg, size_t buflen);
  void CloseChannel();

  GuardOptions options_;
  Capabilities enforced_;
  // Compiled filter, written by the parent and read by the child.
  int filter_fd_ = -1;
  // The parent writes one byte once the filter is complete.
  int ready_fds_[2] = {-1, -1};
#if defined(__linux__)
  std::vector<struct sock_filter> filter_;
#endif
};

}  // namespace sandbox

#endif
