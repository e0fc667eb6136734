#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs each program with the configured interpreter, in a fresh directory
// under --temp_directory, inside a sandbox.
class LocalExecutor : public Executor {
 public:
  proto::Verdict Execute(const proto::Job& job) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;
  LocalExecutor();

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kCompletionFile = "completed";
  static const constexpr size_t kStderrTail = 4096;

  // Runs the job, throwing on harness errors.
  void Run(const proto::Job& job, proto::Verdict* verdict);

  // Fills in the outcome of a program that was started. completed tells
  // whether the program reached its end.
  void SetOutcome(const sandbox::ExecutionInfo& info,
                  const std::string& stderr_file, bool completed,
                  proto::Verdict* verdict);

  sandbox::ExecutionOptions BaseOptions(const std::string& box_dir) const;

  std::string interpreter_;
  std::vector<std::string> interpreter_args_;
};

}  // namespace executor

#endif
