#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <map>
#include <string>
#include <vector>

#include "core/orchestrator.hpp"
#include "proto/evaluation.pb.h"

namespace manager {

// Verdict counts of each task, in order of first appearance.
struct PassCounts {
  std::vector<std::string> task_ids;
  std::vector<int64_t> num_passed;
  std::vector<int64_t> num_samples;
};

PassCounts CountPassed(const std::vector<proto::Verdict>& verdicts);

// Number of verdicts with each outcome.
std::map<proto::Outcome, int64_t> CountOutcomes(
    const std::vector<proto::Verdict>& verdicts);

// Runs the jobs, appending every verdict to verdicts_path as soon as it is
// available. The file is truncated first.
std::vector<proto::Verdict> Evaluate(core::Orchestrator* orchestrator,
                                     const std::vector<proto::Job>& jobs,
                                     const std::string& verdicts_path);

// Computes pass@k over the verdicts. If num_samples is 0, the number of
// verdicts of each task is used as its number of samples.
proto::ScoreReport ScoreVerdicts(const std::vector<proto::Verdict>& verdicts,
                                 int64_t num_samples, int64_t k);

}  // namespace manager

#endif  // MANAGER_EVALUATION_HPP
