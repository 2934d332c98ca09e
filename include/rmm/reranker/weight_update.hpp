#pragma once

#include "rmm/common/result.hpp"
#include "rmm/reranker/citations.hpp"
#include "rmm/reranker/reranker.hpp"

#include <string>
#include <vector>

namespace rmm::reranker {

struct WeightUpdate {
  RerankerState state;
  std::vector<Citation> citations;
  std::vector<double> rewards;
  /// False when the trace did not match the state and the weights were left alone.
  bool applied = false;
};

/// Learning-rate-scaled REINFORCE step for both transforms. Steps from
/// several turns can be summed before they are applied.
struct GradientStep {
  Matrix query_transform;
  Matrix memory_transform;
};

[[nodiscard]] GradientStep zero_step(std::size_t dimension);

/// Softmax of score / temperature.
[[nodiscard]] std::vector<double> selection_probabilities(const std::vector<double> &scores,
                                                          double temperature);

/// REINFORCE step over the shown candidates; `rewards[i]` belongs to
/// trace.selected[i]. Fails when the trace does not match the state.
[[nodiscard]] common::Result<GradientStep> reinforce_step(const RerankerState &state,
                                                          const SampleTrace &trace,
                                                          const std::vector<double> &rewards);

/// state.weights += step, then clip. Non-finite results leave state untouched.
[[nodiscard]] common::Status apply_step(RerankerState &state, const GradientStep &step,
                                        double clip_threshold);

/// One REINFORCE step over the shown candidates, then clip to +-clip_threshold.
/// `rewards[i]` belongs to trace.selected[i].
[[nodiscard]] common::Status apply_reinforce_update(RerankerState &state,
                                                    const SampleTrace &trace,
                                                    const std::vector<double> &rewards,
                                                    double clip_threshold);

/// Parse citations from the answer and update. Runs with all-zero rewards
/// when nothing usable is cited.
[[nodiscard]] WeightUpdate update(const SampleTrace &trace, const std::string &answer,
                                  const RerankerState &state, double clip_threshold = 100.0);

} // namespace rmm::reranker
