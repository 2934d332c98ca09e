#include "rmm/reranker/weight_update.hpp"

#include <algorithm>
#include <cmath>

namespace rmm::reranker {

namespace {

common::Status check_trace(const RerankerState &state, const SampleTrace &trace,
                           const std::vector<double> &rewards) {
  const std::size_t dim = state.weights.query_transform.rows();
  const std::size_t count = trace.scores.size();
  if (trace.query_embedding.size() != dim || trace.transformed_query.size() != dim) {
    return common::Status::error("query vectors do not match the transform dimension");
  }
  if (trace.memory_embeddings.size() != count || trace.transformed_memories.size() != count) {
    return common::Status::error("trace candidate vectors do not match the score count");
  }
  for (std::size_t i = 0; i < count; ++i) {
    if (trace.memory_embeddings[i].size() != dim || trace.transformed_memories[i].size() != dim) {
      return common::Status::error("memory vectors do not match the transform dimension");
    }
  }
  for (const auto &picked : trace.selected) {
    if (picked.candidate_index >= count) {
      return common::Status::error("sampled candidate index out of range");
    }
  }
  if (rewards.size() != trace.selected.size()) {
    return common::Status::error("one reward per shown candidate is required");
  }
  return common::Status::success();
}

std::vector<double> expectation(const std::vector<std::vector<double>> &vectors,
                                const std::vector<double> &weights, const std::size_t dim) {
  std::vector<double> out(dim, 0.0);
  for (std::size_t j = 0; j < vectors.size(); ++j) {
    for (std::size_t d = 0; d < dim; ++d) {
      out[d] += weights[j] * vectors[j][d];
    }
  }
  return out;
}

std::vector<double> minus(const std::vector<double> &lhs, const std::vector<double> &rhs) {
  std::vector<double> out(lhs.size());
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    out[i] = lhs[i] - rhs[i];
  }
  return out;
}

} // namespace

std::vector<double> selection_probabilities(const std::vector<double> &scores,
                                            const double temperature) {
  if (scores.empty()) {
    return {};
  }
  std::vector<double> out(scores.size());
  double max_logit = scores.front() / temperature;
  for (const double score : scores) {
    max_logit = std::max(max_logit, score / temperature);
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    out[i] = std::exp(scores[i] / temperature - max_logit);
    sum += out[i];
  }
  for (double &p : out) {
    p /= sum;
  }
  return out;
}

GradientStep zero_step(const std::size_t dimension) {
  return GradientStep{.query_transform = Matrix(dimension, dimension),
                      .memory_transform = Matrix(dimension, dimension)};
}

common::Result<GradientStep> reinforce_step(const RerankerState &state, const SampleTrace &trace,
                                            const std::vector<double> &rewards) {
  using ResultT = common::Result<GradientStep>;
  if (auto status = check_trace(state, trace, rewards); !status.ok()) {
    return ResultT::failure(status.error());
  }

  const std::size_t dim = trace.query_embedding.size();
  GradientStep step = zero_step(dim);
  if (trace.selected.empty()) {
    return ResultT::success(std::move(step));
  }

  const auto probabilities = selection_probabilities(trace.scores, trace.temperature);
  const auto expected_transformed = expectation(trace.transformed_memories, probabilities, dim);
  const auto expected_raw = expectation(trace.memory_embeddings, probabilities, dim);
  const double rate = state.config.learning_rate;

  for (std::size_t i = 0; i < trace.selected.size(); ++i) {
    const double advantage = rewards[i] - state.config.baseline;
    if (advantage == 0.0) {
      continue;
    }
    const std::size_t k = trace.selected[i].candidate_index;
    step.query_transform.add_outer(rate * advantage,
                                   minus(trace.transformed_memories[k], expected_transformed),
                                   trace.query_embedding);
    step.memory_transform.add_outer(rate * advantage, trace.transformed_query,
                                    minus(trace.memory_embeddings[k], expected_raw));
  }
  return ResultT::success(std::move(step));
}

common::Status apply_step(RerankerState &state, const GradientStep &step,
                          const double clip_threshold) {
  const std::size_t dim = state.weights.query_transform.rows();
  if (step.query_transform.rows() != dim || step.query_transform.cols() != dim ||
      step.memory_transform.rows() != dim || step.memory_transform.cols() != dim) {
    return common::Status::error("gradient step does not match the transform dimension");
  }

  Matrix query_transform = state.weights.query_transform;
  Matrix memory_transform = state.weights.memory_transform;
  query_transform.add(step.query_transform);
  memory_transform.add(step.memory_transform);
  query_transform.clip(clip_threshold);
  memory_transform.clip(clip_threshold);
  if (!query_transform.is_finite() || !memory_transform.is_finite()) {
    return common::Status::error("update produced non-finite weights");
  }

  state.weights.query_transform = std::move(query_transform);
  state.weights.memory_transform = std::move(memory_transform);
  return common::Status::success();
}

common::Status apply_reinforce_update(RerankerState &state, const SampleTrace &trace,
                                      const std::vector<double> &rewards,
                                      const double clip_threshold) {
  auto step = reinforce_step(state, trace, rewards);
  if (!step.ok()) {
    return common::Status::error(step.error());
  }
  if (trace.selected.empty()) {
    return common::Status::success();
  }
  return apply_step(state, step.value(), clip_threshold);
}

WeightUpdate update(const SampleTrace &trace, const std::string &answer,
                    const RerankerState &state, const double clip_threshold) {
  WeightUpdate out{.state = state};
  out.citations = extract_citations(answer, trace.selected.size());
  out.rewards = compute_rewards(out.citations, trace.selected.size());
  out.applied = apply_reinforce_update(out.state, trace, out.rewards, clip_threshold).ok();
  return out;
}

} // namespace rmm::reranker
