#ifndef CORE_ORCHESTRATOR_HPP
#define CORE_ORCHESTRATOR_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "executor/executor.hpp"
#include "proto/evaluation.pb.h"

namespace core {

// Runs jobs on a pool of worker threads, each driving one execution at a
// time. Every job produces exactly one verdict.
class Orchestrator {
 public:
  using VerdictCallback = std::function<void(const proto::Verdict&)>;

  struct RunProgress {
    int64_t completed = 0;
    int64_t total = 0;
  };

  // Number of workers to use for num_jobs jobs: the requested number, capped
  // by the hardware concurrency and by the number of jobs. A non-positive
  // request means one worker per core.
  static int32_t ClampWorkers(int32_t requested, size_t num_jobs);

  Orchestrator(executor::Executor* executor, int32_t num_workers)
      : executor_(executor), num_workers_(num_workers) {}

  // Executes all the jobs and returns the verdicts in completion order.
  // callback, if set, is called with each verdict as soon as it is
  // available; calls are serialized. Run must not be called concurrently.
  std::vector<proto::Verdict> Run(const std::vector<proto::Job>& jobs,
                                  const VerdictCallback& callback = nullptr);

  // Jobs of the current or next run that did not start yet complete with an
  // ERROR verdict. Running jobs are not interrupted. The next run after that
  // executes normally.
  void Stop() { stopped_ = true; }

  RunProgress Progress() const;

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  Orchestrator& operator=(Orchestrator&&) = delete;
  ~Orchestrator() = default;

 private:
  void ThreadBody(const VerdictCallback& callback);
  proto::Verdict RunJob(const proto::Job& job);
  void Record(proto::Verdict verdict, const VerdictCallback& callback);

  executor::Executor* executor_;
  int32_t num_workers_;
  std::atomic<bool> stopped_{false};

  std::queue<const proto::Job*> jobs_;
  std::mutex jobs_mutex_;

  mutable absl::Mutex results_mutex_;
  std::vector<proto::Verdict> results_ GUARDED_BY(results_mutex_);
  int64_t completed_ GUARDED_BY(results_mutex_) = 0;
  int64_t total_ GUARDED_BY(results_mutex_) = 0;

  // Serializes the callback without holding results_mutex_.
  absl::Mutex callback_mutex_;
};

}  // namespace core

#endif
