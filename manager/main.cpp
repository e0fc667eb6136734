#include <signal.h>

#include <atomic>
#include <vector>

#include "core/orchestrator.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/evaluation.hpp"
#include "proto/evaluation.pb.h"
#include "util/flags.hpp"
#include "util/jsonl.hpp"

DEFINE_string(jobs, "", "JSON-lines file with the jobs to run");  // NOLINT
DEFINE_string(verdicts, "verdicts.jsonl",                          // NOLINT
              "JSON-lines file the verdicts are written to");
DEFINE_string(result, "result.jsonl",  // NOLINT
              "JSON-lines file the score report is appended to");
DEFINE_int64(num_samples, 0,
             "Number of samples of every task. If 0, the number of verdicts "
             "of each task is used");
DEFINE_int64(k, 1, "k of pass@k");
DEFINE_bool(score_only, false,
            "Do not run anything, only score the existing verdicts");

namespace {
std::atomic<core::Orchestrator*> running_orchestrator{nullptr};

// Ctrl-C cancels the jobs that did not start yet. Running programs are in a
// different session and are not interrupted.
void StopOnInterrupt(int /*signum*/) {
  core::Orchestrator* orchestrator = running_orchestrator.load();
  if (orchestrator != nullptr) orchestrator->Stop();
}

int Run() {
  if (!FLAGS_score_only) {
    std::vector<proto::Job> jobs = util::ReadJsonl<proto::Job>(FLAGS_jobs);
    LOG(INFO) << "Loaded " << jobs.size() << " jobs from " << FLAGS_jobs;

    executor::LocalExecutor executor;
    core::Orchestrator orchestrator(&executor, FLAGS_num_workers);
    running_orchestrator = &orchestrator;
    struct sigaction action {};
    action.sa_handler = StopOnInterrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);

    manager::Evaluate(&orchestrator, jobs, FLAGS_verdicts);

    signal(SIGINT, SIG_DFL);
    running_orchestrator = nullptr;
  }

  std::vector<proto::Verdict> verdicts =
      util::ReadJsonl<proto::Verdict>(FLAGS_verdicts);
  for (const auto& outcome : manager::CountOutcomes(verdicts)) {
    LOG(INFO) << proto::Outcome_Name(outcome.first) << ": " << outcome.second;
  }
  proto::ScoreReport report =
      manager::ScoreVerdicts(verdicts, FLAGS_num_samples, FLAGS_k);
  LOG(INFO) << "pass@" << report.k() << " over " << report.num_tasks()
            << " tasks: " << report.score();
  util::AppendJsonl(FLAGS_result, report);
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs the programs in --jobs and computes their pass@k");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  CHECK(FLAGS_score_only || !FLAGS_jobs.empty())
      << "--jobs is required unless --score_only is set";
  CHECK_GE(FLAGS_k, 1) << "k must be positive";

  try {
    return Run();
  } catch (const std::exception& exc) {
    LOG(ERROR) << exc.what();
    return 1;
  }
}
