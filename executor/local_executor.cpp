#include "executor/local_executor.hpp"

#include <limits.h>
#include <signal.h>
#include <stdlib.h>

#include <cmath>
#include <random>
#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {
// Runs the program given as first argument as __main__, with the exit
// functions disabled, and writes the completion token once it returns.
const char* const kBootstrap = R"(import builtins, os, runpy, sys
_path = os.environ.pop('EVALBOX_COMPLETION_FILE')
_token = os.environ.pop('EVALBOX_COMPLETION_TOKEN').encode()
_open, _write, _close = os.open, os.write, os.close
_flags = os.O_WRONLY | os.O_CREAT | os.O_TRUNC
builtins.exit = None
builtins.quit = None
sys.exit = None
os._exit = None
os.abort = None
sys.argv = sys.argv[1:]
runpy.run_path(sys.argv[0], run_name='__main__')
_fd = _open(_path, _flags, 0o600)
_write(_fd, _token)
_close(_fd)
)";

std::string RandomToken() {
  std::random_device rd;
  std::string token;
  for (int i = 0; i < 4; i++) absl::StrAppend(&token, absl::Hex(rd()));
  return token;
}

// Returns the last line of text that is not blank.
std::string LastNonEmptyLine(const std::string& text) {
  std::vector<absl::string_view> lines = absl::StrSplit(text, '\n');
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    absl::string_view line = absl::StripAsciiWhitespace(*it);
    if (!line.empty()) return std::string(line);
  }
  return "";
}

std::string RealPath(const std::string& path) {
  char buf[PATH_MAX] = {};
  if (realpath(path.c_str(), buf) == nullptr) return path;
  return buf;
}
}  // namespace

namespace executor {

LocalExecutor::LocalExecutor() {
  util::File::MakeDirs(FLAGS_temp_directory);

  // Interpreters are often wrapper scripts that spawn the real binary, which
  // the sandbox would not allow.
  try {
    std::string path = util::which(FLAGS_interpreter);
    if (!path.empty()) interpreter_ = RealPath(path);
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Cannot look up " << FLAGS_interpreter << ": " << e.what();
  }
  if (interpreter_.empty()) {
    LOG(ERROR) << "Interpreter " << FLAGS_interpreter << " not found";
  }
  std::vector<std::string> args =
      absl::StrSplit(FLAGS_interpreter_args, ' ', absl::SkipEmpty());
  interpreter_args_ = std::move(args);

  const sandbox::Capabilities& caps = sandbox::SafetyGuard::HostCapabilities();
  if (!caps.resource_limits) {
    LOG_FIRST_N(WARNING, 1) << "Resource limits are not enforced on this host";
  }
  if (!caps.stack_limit) {
    LOG_FIRST_N(WARNING, 1) << "The stack limit is not enforced on this host";
  }
  if (!caps.syscall_filter) {
    LOG_FIRST_N(WARNING, 1)
        << "Syscall filtering is not available: programs can modify the "
           "filesystem and create processes";
  }
}

proto::Verdict LocalExecutor::Execute(const proto::Job& job) {
  proto::Verdict verdict;
  verdict.set_task_id(job.task_id());
  verdict.set_completion_id(job.completion_id());
  verdict.set_solution_echo(job.program_text());
  try {
    Run(job, &verdict);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Task " << job.task_id() << " completion "
                 << job.completion_id() << ": " << e.what();
    verdict.set_outcome(proto::Outcome::ERROR);
    verdict.set_detail(e.what());
  }
  verdict.set_passed(verdict.outcome() == proto::Outcome::PASSED);
  return verdict;
}

sandbox::ExecutionOptions LocalExecutor::BaseOptions(
    const std::string& box_dir) const {
  sandbox::ExecutionOptions options(box_dir, interpreter_);
  options.args = interpreter_args_;
  options.guard.memory_limit_kb = FLAGS_memory_limit_kb;
  options.guard.max_file_size_kb = FLAGS_max_file_size_kb;
  options.guard.max_files = FLAGS_max_files;
  options.guard.max_stack_kb = FLAGS_max_stack_kb;

  const char* path = getenv("PATH");
  options.env.push_back(std::string("PATH=") +
                        (path ? path : "/usr/local/bin:/usr/bin:/bin"));
  options.env.push_back("LANG=C.UTF-8");
  // Numerical libraries would otherwise start one thread per core in each
  // of the concurrent programs.
  options.env.push_back("OMP_NUM_THREADS=1");
  return options;
}

void LocalExecutor::Run(const proto::Job& job, proto::Verdict* verdict) {
  if (!(job.timeout() > 0) || !std::isfinite(job.timeout())) {
    throw std::invalid_argument("Invalid timeout: " +
                                std::to_string(job.timeout()));
  }
  if (interpreter_.empty()) {
    throw std::runtime_error("Interpreter " + FLAGS_interpreter +
                             " not found");
  }

  util::TempDir tmp(FLAGS_temp_directory);
  if (FLAGS_keep_sandboxes) tmp.Keep();
  std::string box_dir = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(box_dir);
  util::File::Write(util::File::JoinPath(box_dir, FLAGS_program_name),
                    job.program_text());

  sandbox::ExecutionOptions options = BaseOptions(box_dir);
  std::string completion_file;
  std::string token;
  if (FLAGS_completion_check) {
    completion_file = util::File::JoinPath(tmp.Path(), kCompletionFile);
    token = RandomToken();
    options.args.push_back("-c");
    options.args.push_back(kBootstrap);
    options.env.push_back("EVALBOX_COMPLETION_FILE=" + completion_file);
    options.env.push_back("EVALBOX_COMPLETION_TOKEN=" + token);
  }
  options.args.push_back(FLAGS_program_name);
  options.wall_limit_millis = std::ceil(job.timeout() * 1000);
  // The cpu limit only catches programs that escape the wall clock.
  options.guard.cpu_limit_millis = (std::ceil(job.timeout()) + 1) * 1000;
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

  sandbox::ExecutionInfo info;
  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  VLOG(1) << "Running task " << job.task_id() << " completion "
          << job.completion_id() << " in " << box_dir;
  if (!sb->Execute(options, &info, &error_msg)) {
    throw std::runtime_error(error_msg);
  }

  // Resource usage.
  proto::ResourceUsage* usage = verdict->mutable_resource_usage();
  usage->set_cpu_time(info.cpu_time_millis / 1000.0);
  usage->set_sys_time(info.sys_time_millis / 1000.0);
  usage->set_wall_time(info.wall_time_millis / 1000.0);
  usage->set_memory_kb(info.memory_usage_kb);

  bool completed = true;
  if (FLAGS_completion_check) {
    completed = util::File::Exists(completion_file) &&
                util::File::Read(completion_file) == token;
  }
  SetOutcome(info, options.stderr_file, completed, verdict);
}

void LocalExecutor::SetOutcome(const sandbox::ExecutionInfo& info,
                               const std::string& stderr_file,
                               bool completed, proto::Verdict* verdict) {
  if (info.killed || info.signal == SIGXCPU) {
    verdict->set_outcome(proto::Outcome::TIMED_OUT);
    verdict->set_detail("Timed out");
  } else if (info.signal) {
    verdict->set_outcome(proto::Outcome::FAILED);
    verdict->set_detail("Killed by signal " + std::to_string(info.signal));
  } else if (info.status_code) {
    verdict->set_outcome(proto::Outcome::FAILED);
    std::string detail;
    try {
      detail = LastNonEmptyLine(util::File::ReadTail(stderr_file, kStderrTail));
    } catch (const std::system_error& e) {
      LOG(WARNING) << "Cannot read " << stderr_file << ": " << e.what();
    }
    if (detail.empty()) {
      detail = "Exited with status " + std::to_string(info.status_code);
    }
    verdict->set_detail(detail);
  } else if (!completed) {
    verdict->set_outcome(proto::Outcome::FAILED);
    verdict->set_detail("Exited before completion");
  } else {
    verdict->set_outcome(proto::Outcome::PASSED);
  }
}

}  // namespace executor
