#include "score/pass_at_k.hpp"

#include <numeric>
#include <stdexcept>
#include <string>

namespace score {

double EstimatePassAtK(int64_t n, int64_t c, int64_t k) {
  if (k < 1) {
    throw std::invalid_argument("k must be positive, got " + std::to_string(k));
  }
  if (c < 0 || c > n) {
    throw std::invalid_argument("Invalid number of correct samples: " +
                                std::to_string(c) + " of " + std::to_string(n));
  }
  if (k > n) {
    throw std::invalid_argument("k = " + std::to_string(k) +
                                " is larger than the number of samples " +
                                std::to_string(n));
  }
  // Every subset of k samples contains a correct one.
  if (n - c < k) return 1.0;
  double prob_all_wrong = 1.0;
  for (int64_t i = n - c + 1; i <= n; i++) {
    prob_all_wrong *= 1.0 - static_cast<double>(k) / i;
  }
  return 1.0 - prob_all_wrong;
}

std::vector<double> EstimatePassAtK(int64_t num_samples,
                                    const std::vector<int64_t>& num_correct,
                                    int64_t k) {
  return EstimatePassAtK(
      std::vector<int64_t>(num_correct.size(), num_samples), num_correct, k);
}

std::vector<double> EstimatePassAtK(const std::vector<int64_t>& num_samples,
                                    const std::vector<int64_t>& num_correct,
                                    int64_t k) {
  if (num_samples.size() != num_correct.size()) {
    throw std::invalid_argument(
        "Got " + std::to_string(num_samples.size()) + " sample counts for " +
        std::to_string(num_correct.size()) + " tasks");
  }
  std::vector<double> scores;
  scores.reserve(num_correct.size());
  for (size_t i = 0; i < num_correct.size(); i++) {
    scores.push_back(EstimatePassAtK(num_samples[i], num_correct[i], k));
  }
  return scores;
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) return 0;
  return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

proto::ScoreReport Score(const proto::ScoreRequest& request) {
  std::vector<int64_t> num_correct(request.per_task_pass_counts().begin(),
                                   request.per_task_pass_counts().end());
  std::vector<double> scores;
  if (request.per_task_num_samples_size()) {
    std::vector<int64_t> num_samples(request.per_task_num_samples().begin(),
                                     request.per_task_num_samples().end());
    scores = EstimatePassAtK(num_samples, num_correct, request.k());
  } else {
    scores = EstimatePassAtK(request.num_samples(), num_correct, request.k());
  }

  proto::ScoreReport report;
  report.set_k(request.k());
  report.set_num_tasks(scores.size());
  for (double score : scores) report.add_per_task(score);
  report.set_score(Mean(scores));
  return report;
}

}  // namespace score
