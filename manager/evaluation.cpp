#include "manager/evaluation.hpp"

#include <unordered_map>

#include "glog/logging.h"
#include "score/pass_at_k.hpp"
#include "util/file.hpp"
#include "util/jsonl.hpp"

namespace manager {

PassCounts CountPassed(const std::vector<proto::Verdict>& verdicts) {
  PassCounts counts;
  std::unordered_map<std::string, size_t> index;
  for (const proto::Verdict& verdict : verdicts) {
    auto it = index.find(verdict.task_id());
    if (it == index.end()) {
      it = index.emplace(verdict.task_id(), counts.task_ids.size()).first;
      counts.task_ids.push_back(verdict.task_id());
      counts.num_passed.push_back(0);
      counts.num_samples.push_back(0);
    }
    counts.num_samples[it->second]++;
    if (verdict.passed()) counts.num_passed[it->second]++;
  }
  return counts;
}

std::map<proto::Outcome, int64_t> CountOutcomes(
    const std::vector<proto::Verdict>& verdicts) {
  std::map<proto::Outcome, int64_t> counts;
  for (const proto::Verdict& verdict : verdicts) counts[verdict.outcome()]++;
  return counts;
}

std::vector<proto::Verdict> Evaluate(core::Orchestrator* orchestrator,
                                     const std::vector<proto::Job>& jobs,
                                     const std::string& verdicts_path) {
  util::File::Write(verdicts_path, "", /*overwrite = */ true);
  return orchestrator->Run(jobs,
                           [&verdicts_path](const proto::Verdict& verdict) {
                             util::AppendJsonl(verdicts_path, verdict);
                           });
}

proto::ScoreReport ScoreVerdicts(const std::vector<proto::Verdict>& verdicts,
                                 int64_t num_samples, int64_t k) {
  PassCounts counts = CountPassed(verdicts);
  proto::ScoreRequest request;
  request.set_k(k);
  if (num_samples) {
    request.set_num_samples(num_samples);
  } else {
    for (int64_t n : counts.num_samples) request.add_per_task_num_samples(n);
  }
  for (int64_t c : counts.num_passed) request.add_per_task_pass_counts(c);
  VLOG(1) << "Scoring " << counts.task_ids.size() << " tasks";

  proto::ScoreReport report = score::Score(request);
  for (const std::string& task_id : counts.task_ids) {
    report.add_task_ids(task_id);
  }
  return report;
}

}  // namespace manager
