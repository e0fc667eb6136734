#include "core/orchestrator.hpp"

#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class MockExecutor : public executor::Executor {
 public:
  MOCK_METHOD1(Execute, proto::Verdict(const proto::Job& job));
};

proto::Verdict PassedVerdict(const proto::Job& job) {
  proto::Verdict verdict;
  verdict.set_task_id(job.task_id());
  verdict.set_completion_id(job.completion_id());
  verdict.set_outcome(proto::Outcome::PASSED);
  verdict.set_passed(true);
  return verdict;
}

std::vector<proto::Job> MakeJobs(size_t num_tasks, size_t per_task) {
  std::vector<proto::Job> jobs;
  for (size_t task = 0; task < num_tasks; task++) {
    for (size_t completion = 0; completion < per_task; completion++) {
      proto::Job job;
      job.set_task_id(std::to_string(task));
      job.set_completion_id(completion);
      job.set_program_text("pass");
      job.set_timeout(1.0);
      jobs.push_back(job);
    }
  }
  return jobs;
}

std::set<std::pair<std::string, int64_t>> Keys(
    const std::vector<proto::Verdict>& verdicts) {
  std::set<std::pair<std::string, int64_t>> keys;
  for (const proto::Verdict& verdict : verdicts) {
    keys.emplace(verdict.task_id(), verdict.completion_id());
  }
  return keys;
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, ClampWorkers) {
  int32_t hardware = std::max(1u, std::thread::hardware_concurrency());
  EXPECT_EQ(core::Orchestrator::ClampWorkers(4, 2), std::min(2, hardware));
  EXPECT_EQ(core::Orchestrator::ClampWorkers(1, 100), 1);
  EXPECT_EQ(core::Orchestrator::ClampWorkers(hardware + 10, 1000), hardware);
  EXPECT_EQ(core::Orchestrator::ClampWorkers(0, 1000), hardware);
  EXPECT_EQ(core::Orchestrator::ClampWorkers(-3, 1), 1);
  EXPECT_EQ(core::Orchestrator::ClampWorkers(4, 0), 0);
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, OneVerdictPerJob) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_))
      .Times(100)
      .WillRepeatedly(Invoke(PassedVerdict));
  core::Orchestrator orchestrator(&executor, 4);
  std::vector<proto::Job> jobs = MakeJobs(10, 10);
  std::vector<proto::Verdict> verdicts = orchestrator.Run(jobs);
  EXPECT_EQ(verdicts.size(), 100u);
  EXPECT_EQ(Keys(verdicts).size(), 100u);
  core::Orchestrator::RunProgress progress = orchestrator.Progress();
  EXPECT_EQ(progress.completed, 100);
  EXPECT_EQ(progress.total, 100);
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, NoJobs) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_)).Times(0);
  core::Orchestrator orchestrator(&executor, 4);
  EXPECT_TRUE(orchestrator.Run({}).empty());
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, CompletionOrder) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_))
      .WillRepeatedly(Invoke([](const proto::Job& job) {
        // The first job is the slowest.
        if (job.completion_id() == 0) {
          std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }
        return PassedVerdict(job);
      }));
  if (core::Orchestrator::ClampWorkers(2, 2) < 2) {
    GTEST_SKIP() << "a single core is available";
  }
  core::Orchestrator orchestrator(&executor, 2);
  std::vector<proto::Verdict> verdicts = orchestrator.Run(MakeJobs(1, 2));
  ASSERT_EQ(verdicts.size(), 2u);
  EXPECT_EQ(verdicts[0].completion_id(), 1);
  EXPECT_EQ(verdicts[1].completion_id(), 0);
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, WorkerFailureBecomesError) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_))
      .WillRepeatedly(Invoke([](const proto::Job& job) -> proto::Verdict {
        if (job.completion_id() == 3) throw std::runtime_error("boom");
        return PassedVerdict(job);
      }));
  core::Orchestrator orchestrator(&executor, 3);
  std::vector<proto::Verdict> verdicts = orchestrator.Run(MakeJobs(2, 5));
  ASSERT_EQ(verdicts.size(), 10u);
  EXPECT_EQ(Keys(verdicts).size(), 10u);
  int errors = 0;
  for (const proto::Verdict& verdict : verdicts) {
    if (verdict.completion_id() == 3) {
      EXPECT_EQ(verdict.outcome(), proto::Outcome::ERROR);
      EXPECT_FALSE(verdict.passed());
      EXPECT_EQ(verdict.detail(), "Worker failure: boom");
      errors++;
    } else {
      EXPECT_EQ(verdict.outcome(), proto::Outcome::PASSED);
    }
  }
  EXPECT_EQ(errors, 2);
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, UnknownWorkerFailureBecomesError) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_))
      .WillRepeatedly(Invoke([](const proto::Job& job) -> proto::Verdict {
        if (job.completion_id() == 1) throw 42;
        return PassedVerdict(job);
      }));
  core::Orchestrator orchestrator(&executor, 2);
  std::vector<proto::Verdict> verdicts = orchestrator.Run(MakeJobs(2, 2));
  ASSERT_EQ(verdicts.size(), 4u);
  EXPECT_EQ(Keys(verdicts).size(), 4u);
  for (const proto::Verdict& verdict : verdicts) {
    if (verdict.completion_id() == 1) {
      EXPECT_EQ(verdict.outcome(), proto::Outcome::ERROR);
      EXPECT_EQ(verdict.detail(), "Worker failure: unknown exception");
    } else {
      EXPECT_EQ(verdict.outcome(), proto::Outcome::PASSED);
    }
  }
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, CallbackSeesEveryVerdict) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_)).WillRepeatedly(Invoke(PassedVerdict));
  core::Orchestrator orchestrator(&executor, 4);
  std::vector<proto::Verdict> seen;
  std::vector<proto::Verdict> verdicts =
      orchestrator.Run(MakeJobs(5, 4), [&seen](const proto::Verdict& verdict) {
        seen.push_back(verdict);
      });
  ASSERT_EQ(seen.size(), verdicts.size());
  EXPECT_EQ(Keys(seen), Keys(verdicts));
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, CallbackCanQueryProgress) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_)).WillRepeatedly(Invoke(PassedVerdict));
  core::Orchestrator orchestrator(&executor, 4);
  std::vector<int64_t> completed;
  std::vector<proto::Verdict> verdicts = orchestrator.Run(
      MakeJobs(4, 5), [&orchestrator, &completed](const proto::Verdict&) {
        core::Orchestrator::RunProgress progress = orchestrator.Progress();
        EXPECT_EQ(progress.total, 20);
        completed.push_back(progress.completed);
      });
  EXPECT_EQ(verdicts.size(), 20u);
  ASSERT_EQ(completed.size(), 20u);
  for (int64_t value : completed) {
    EXPECT_GE(value, 1);
    EXPECT_LE(value, 20);
  }
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, CallbackFailureKeepsVerdict) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_)).WillRepeatedly(Invoke(PassedVerdict));
  core::Orchestrator orchestrator(&executor, 2);
  std::vector<proto::Verdict> verdicts = orchestrator.Run(
      MakeJobs(2, 2),
      [](const proto::Verdict&) { throw std::runtime_error("disk full"); });
  EXPECT_EQ(verdicts.size(), 4u);
  verdicts = orchestrator.Run(MakeJobs(1, 2),
                              [](const proto::Verdict&) { throw 7; });
  EXPECT_EQ(verdicts.size(), 2u);
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, StopBeforeRun) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_)).Times(0);
  core::Orchestrator orchestrator(&executor, 4);
  orchestrator.Stop();
  std::vector<proto::Verdict> verdicts = orchestrator.Run(MakeJobs(3, 3));
  ASSERT_EQ(verdicts.size(), 9u);
  EXPECT_EQ(Keys(verdicts).size(), 9u);
  for (const proto::Verdict& verdict : verdicts) {
    EXPECT_EQ(verdict.outcome(), proto::Outcome::ERROR);
    EXPECT_EQ(verdict.detail(), "Cancelled");
  }
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, StopDuringRun) {
  MockExecutor executor;
  core::Orchestrator orchestrator(&executor, 1);
  EXPECT_CALL(executor, Execute(_))
      .WillOnce(Invoke([&orchestrator](const proto::Job& job) {
        orchestrator.Stop();
        return PassedVerdict(job);
      }));
  std::vector<proto::Verdict> verdicts = orchestrator.Run(MakeJobs(1, 5));
  ASSERT_EQ(verdicts.size(), 5u);
  EXPECT_EQ(Keys(verdicts).size(), 5u);
  EXPECT_EQ(verdicts[0].outcome(), proto::Outcome::PASSED);
  for (size_t i = 1; i < verdicts.size(); i++) {
    EXPECT_EQ(verdicts[i].outcome(), proto::Outcome::ERROR);
  }
}

// NOLINTNEXTLINE
TEST(OrchestratorTest, RunAfterStopExecutes) {
  MockExecutor executor;
  EXPECT_CALL(executor, Execute(_)).WillRepeatedly(Invoke(PassedVerdict));
  core::Orchestrator orchestrator(&executor, 2);
  orchestrator.Stop();
  std::vector<proto::Verdict> verdicts = orchestrator.Run(MakeJobs(1, 3));
  ASSERT_EQ(verdicts.size(), 3u);
  for (const proto::Verdict& verdict : verdicts) {
    EXPECT_EQ(verdict.outcome(), proto::Outcome::ERROR);
  }
  verdicts = orchestrator.Run(MakeJobs(2, 3));
  ASSERT_EQ(verdicts.size(), 6u);
  for (const proto::Verdict& verdict : verdicts) {
    EXPECT_EQ(verdict.outcome(), proto::Outcome::PASSED);
  }
}

}  // namespace
