#pragma once

#include "rmm/common/result.hpp"
#include "rmm/config/schema.hpp"
#include "rmm/memory/embedder.hpp"
#include "rmm/memory/types.hpp"
#include "rmm/reranker/matrix.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace rmm::reranker {

struct Hyperparameters {
  std::size_t top_k = 20;
  std::size_t top_m = 5;
  double temperature = 0.5;
  double learning_rate = 0.001;
  double baseline = 0.5;

  bool operator==(const Hyperparameters &) const = default;
};

struct RerankerWeights {
  Matrix query_transform;
  Matrix memory_transform;

  bool operator==(const RerankerWeights &) const = default;
};

/// Per-user learned reranker.
struct RerankerState {
  RerankerWeights weights;
  Hyperparameters config;
  std::optional<std::int64_t> updated_at;
};

[[nodiscard]] Hyperparameters hyperparameters_from(const config::RerankerConfig &config);

/// Both transforms start at identity plus N(0, 0.01^2) noise.
[[nodiscard]] RerankerState make_initial_state(const config::RerankerConfig &config,
                                               std::uint64_t seed);

/// Hyperparameter ranges only.
[[nodiscard]] common::Status validate_hyperparameters(const Hyperparameters &config);

/// Square `dimension` x `dimension` finite transforms plus valid hyperparameters.
[[nodiscard]] common::Status validate_state(const RerankerState &state, std::size_t dimension);

struct SampledCandidate {
  std::size_t candidate_index = 0;
  double score = 0.0;
  double gumbel = 0.0;
  std::size_t rank = 0;
};

/// Everything the weight update needs from one select() call.
struct SampleTrace {
  std::vector<double> query_embedding;
  std::vector<double> transformed_query;
  std::vector<std::vector<double>> memory_embeddings;
  std::vector<std::vector<double>> transformed_memories;
  std::vector<double> scores;
  /// Shown order: selected[i] is the memory presented as [i].
  std::vector<SampledCandidate> selected;
  double temperature = 1.0;
};

struct Selection {
  std::vector<memory::RetrievedMemory> memories;
  SampleTrace trace;
};

using UniformSource = std::function<double()>;

/// Stochastic top-m by score/temperature + Gumbel(0, 1), highest perturbed first.
[[nodiscard]] std::vector<SampledCandidate> gumbel_top_m(const std::vector<double> &scores,
                                                         std::size_t m, double temperature,
                                                         const UniformSource &uniform);

class Reranker {
public:
  Reranker(std::shared_ptr<memory::IEmbedder> embedder, std::uint64_t seed);

  /// Empty candidates give an empty selection without touching the embedder.
  [[nodiscard]] common::Result<Selection>
  select(const std::string &query, const std::vector<memory::RetrievedMemory> &candidates,
         const RerankerState &state);

private:
  common::Result<std::vector<std::vector<double>>>
  candidate_embeddings(const std::vector<memory::RetrievedMemory> &candidates);

  std::shared_ptr<memory::IEmbedder> embedder_;
  std::mt19937_64 rng_;
};

} // namespace rmm::reranker
