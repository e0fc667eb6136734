#ifndef SCORE_PASS_AT_K_HPP
#define SCORE_PASS_AT_K_HPP

#include <cstdint>
#include <vector>

#include "proto/evaluation.pb.h"

namespace score {

// Unbiased estimate of the probability that at least one of k samples,
// drawn without replacement from n samples of which c are correct, is
// correct: 1 - C(n - c, k) / C(n, k). Computed as a product to avoid
// overflowing the binomial coefficients.
// Throws std::invalid_argument unless 0 <= c <= n and 1 <= k <= n.
double EstimatePassAtK(int64_t n, int64_t c, int64_t k);

// Per-task estimates with the same number of samples for every task.
std::vector<double> EstimatePassAtK(int64_t num_samples,
                                    const std::vector<int64_t>& num_correct,
                                    int64_t k);

// Per-task estimates with a different number of samples for each task.
std::vector<double> EstimatePassAtK(const std::vector<int64_t>& num_samples,
                                    const std::vector<int64_t>& num_correct,
                                    int64_t k);

// Arithmetic mean; 0 for an empty vector.
double Mean(const std::vector<double>& values);

// Computes the per-task scores and their mean.
proto::ScoreReport Score(const proto::ScoreRequest& request);

}  // namespace score

#endif
