#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <memory>
#include <string>
#include <vector>

#include "sandbox/safety_guard.hpp"

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t wall_limit_millis = 0;
  GuardOptions guard;

  // An empty stdin_file makes every read from standard input fail. Empty
  // stdout_file and stderr_file discard the output.
  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;
  // Full environment of the program, as NAME=value strings.
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was killed because it exceeded the wall time limit.
  bool killed = false;
};

// Sandbox interface. Each execution runs in its own process, with the
// restrictions of options.guard installed before the executable starts.
class Sandbox {
 public:
  // Returns the sandbox implementation for the current platform.
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe, but different
  // instances can be used concurrently.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
