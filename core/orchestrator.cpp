#include "core/orchestrator.hpp"

#include <algorithm>
#include <thread>

#include "glog/logging.h"

namespace {
proto::Verdict ErrorVerdict(const proto::Job& job, const std::string& detail) {
  proto::Verdict verdict;
  verdict.set_task_id(job.task_id());
  verdict.set_completion_id(job.completion_id());
  verdict.set_solution_echo(job.program_text());
  verdict.set_outcome(proto::Outcome::ERROR);
  verdict.set_passed(false);
  verdict.set_detail(detail);
  return verdict;
}
}  // namespace

namespace core {

int32_t Orchestrator::ClampWorkers(int32_t requested, size_t num_jobs) {
  int32_t hardware = std::thread::hardware_concurrency();
  if (hardware <= 0) hardware = 1;
  int32_t workers = requested > 0 ? std::min(requested, hardware) : hardware;
  if (num_jobs < static_cast<size_t>(workers)) workers = num_jobs;
  return workers;
}

std::vector<proto::Verdict> Orchestrator::Run(
    const std::vector<proto::Job>& jobs, const VerdictCallback& callback) {
  {
    std::lock_guard<std::mutex> lck(jobs_mutex_);
    for (const proto::Job& job : jobs) jobs_.push(&job);
  }
  {
    absl::MutexLock lck(&results_mutex_);
    results_.clear();
    results_.reserve(jobs.size());
    completed_ = 0;
    total_ = jobs.size();
  }

  int32_t num_workers = ClampWorkers(num_workers_, jobs.size());
  LOG(INFO) << "Running " << jobs.size() << " jobs on " << num_workers
            << " workers";
  std::vector<std::thread> threads(num_workers);
  for (int32_t i = 0; i < num_workers; i++) {
    threads[i] = std::thread(&Orchestrator::ThreadBody, this, callback);
  }
  for (std::thread& thread : threads) thread.join();
  stopped_ = false;

  std::vector<proto::Verdict> results;
  absl::MutexLock lck(&results_mutex_);
  results.swap(results_);
  return results;
}

void Orchestrator::ThreadBody(const VerdictCallback& callback) {
  while (true) {
    const proto::Job* job = nullptr;
    {
      std::lock_guard<std::mutex> lck(jobs_mutex_);
      if (jobs_.empty()) break;
      job = jobs_.front();
      jobs_.pop();
    }
    if (stopped_) {
      Record(ErrorVerdict(*job, "Cancelled"), callback);
    } else {
      Record(RunJob(*job), callback);
    }
  }
}

proto::Verdict Orchestrator::RunJob(const proto::Job& job) {
  VLOG(1) << "Starting task " << job.task_id() << " completion "
          << job.completion_id();
  try {
    return executor_->Execute(job);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Worker failure on task " << job.task_id()
               << " completion " << job.completion_id() << ": " << exc.what();
    return ErrorVerdict(job, std::string("Worker failure: ") + exc.what());
  } catch (...) {
    LOG(ERROR) << "Worker failure on task " << job.task_id()
               << " completion " << job.completion_id()
               << ": unknown exception";
    return ErrorVerdict(job, "Worker failure: unknown exception");
  }
}

void Orchestrator::Record(proto::Verdict verdict,
                          const VerdictCallback& callback) {
  {
    absl::MutexLock lck(&results_mutex_);
    results_.push_back(verdict);
    completed_++;
    LOG_EVERY_N(INFO, 100) << completed_ << "/" << total_
                           << " jobs completed";
  }
  if (!callback) return;
  absl::MutexLock lck(&callback_mutex_);
  try {
    callback(verdict);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Verdict callback failed for task " << verdict.task_id()
               << ": " << exc.what();
  } catch (...) {
    LOG(ERROR) << "Verdict callback failed for task " << verdict.task_id()
               << ": unknown exception";
  }
}

Orchestrator::RunProgress Orchestrator::Progress() const {
  absl::MutexLock lck(&results_mutex_);
  RunProgress progress;
  progress.completed = completed_;
  progress.total = total_;
  return progress;
}

}  // namespace core
