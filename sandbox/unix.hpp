#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <memory>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The program runs in a new session, so that
// the whole process group can be killed when the time is up.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails. Everything the child needs is allocated here.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing it if it exceeds the
  // provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Kills every process that is left in the group of the child.
  void KillGroup();

  int pipe_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::unique_ptr<SafetyGuard> guard_;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
  std::vector<char*> env_;
};

}  // namespace sandbox
#endif
