#include "rmm/reranker/reranker.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>

namespace rmm::reranker {

namespace {

constexpr double kInitialNoiseStddev = 0.01;
constexpr double kMinUniform = 1e-10;

} // namespace

Hyperparameters hyperparameters_from(const config::RerankerConfig &config) {
  return Hyperparameters{
      .top_k = config.top_k,
      .top_m = config.top_m,
      .temperature = config.temperature,
      .learning_rate = config.learning_rate,
      .baseline = config.baseline,
  };
}

RerankerState make_initial_state(const config::RerankerConfig &config, const std::uint64_t seed) {
  const std::size_t dim = config.embedding_dimension;
  return RerankerState{
      .weights =
          RerankerWeights{
              .query_transform = Matrix::noisy_identity(dim, kInitialNoiseStddev, seed),
              .memory_transform =
                  Matrix::noisy_identity(dim, kInitialNoiseStddev, seed ^ 0x9E3779B97F4A7C15ULL),
          },
      .config = hyperparameters_from(config),
      .updated_at = std::nullopt,
  };
}

common::Status validate_hyperparameters(const Hyperparameters &config) {
  if (config.top_k == 0) {
    return common::Status::error("topK must be > 0");
  }
  if (config.top_m == 0) {
    return common::Status::error("topM must be > 0");
  }
  if (!std::isfinite(config.temperature) || config.temperature <= 0.0) {
    return common::Status::error("temperature must be > 0");
  }
  if (!std::isfinite(config.learning_rate) || config.learning_rate <= 0.0) {
    return common::Status::error("learningRate must be > 0");
  }
  if (!std::isfinite(config.baseline) || config.baseline < 0.0 || config.baseline > 1.0) {
    return common::Status::error("baseline must be in [0, 1]");
  }
  return common::Status::success();
}

common::Status validate_state(const RerankerState &state, const std::size_t dimension) {
  const auto check = [dimension](const Matrix &matrix, const char *name) {
    if (matrix.rows() != dimension || matrix.cols() != dimension) {
      return common::Status::error(std::string(name) + " must be " + std::to_string(dimension) +
                                   "x" + std::to_string(dimension) + ", got " +
                                   std::to_string(matrix.rows()) + "x" +
                                   std::to_string(matrix.cols()));
    }
    if (!matrix.is_finite()) {
      return common::Status::error(std::string(name) + " contains non-finite values");
    }
    return common::Status::success();
  };

  if (dimension == 0) {
    return common::Status::error("embedding dimension must be > 0");
  }
  if (auto status = check(state.weights.query_transform, "queryTransform"); !status.ok()) {
    return status;
  }
  if (auto status = check(state.weights.memory_transform, "memoryTransform"); !status.ok()) {
    return status;
  }
  return validate_hyperparameters(state.config);
}

std::vector<SampledCandidate> gumbel_top_m(const std::vector<double> &scores, const std::size_t m,
                                           const double temperature,
                                           const UniformSource &uniform) {
  const std::size_t count = std::min(m, scores.size());
  if (count == 0) {
    return {};
  }

  std::vector<SampledCandidate> all;
  std::vector<double> perturbed;
  all.reserve(scores.size());
  perturbed.reserve(scores.size());
  for (std::size_t i = 0; i < scores.size(); ++i) {
    const double u = std::clamp(uniform(), kMinUniform, 1.0 - kMinUniform);
    const double g = -std::log(-std::log(u));
    all.push_back(SampledCandidate{.candidate_index = i, .score = scores[i], .gumbel = g});
    perturbed.push_back(scores[i] / temperature + g);
  }

  std::vector<std::size_t> order(scores.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&perturbed](std::size_t lhs, std::size_t rhs) {
                     return perturbed[lhs] > perturbed[rhs];
                   });

  std::vector<SampledCandidate> out;
  out.reserve(count);
  for (std::size_t rank = 0; rank < count; ++rank) {
    SampledCandidate picked = all[order[rank]];
    picked.rank = rank;
    out.push_back(picked);
  }
  return out;
}

Reranker::Reranker(std::shared_ptr<memory::IEmbedder> embedder, const std::uint64_t seed)
    : embedder_(std::move(embedder)), rng_(seed) {}

common::Result<std::vector<std::vector<double>>>
Reranker::candidate_embeddings(const std::vector<memory::RetrievedMemory> &candidates) {
  using ResultT = common::Result<std::vector<std::vector<double>>>;
  const std::size_t dim = embedder_->dimensions();

  std::vector<std::vector<double>> out(candidates.size());
  std::vector<std::size_t> missing;
  std::vector<std::string> texts;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto &stored = candidates[i].memory.embedding;
    if (memory::validate_embedding(stored, dim).ok()) {
      out[i] = stored;
    } else {
      missing.push_back(i);
      texts.push_back(candidates[i].memory.topic_summary);
    }
  }
  if (missing.empty()) {
    return ResultT::success(std::move(out));
  }

  auto embedded = embedder_->embed_batch(texts);
  if (!embedded.ok()) {
    return ResultT::failure("embedding candidates failed: " + embedded.error());
  }
  if (embedded.value().size() != missing.size()) {
    return ResultT::failure("embedder returned the wrong number of candidate vectors");
  }
  for (std::size_t j = 0; j < missing.size(); ++j) {
    auto status = memory::validate_embedding(embedded.value()[j], dim);
    if (!status.ok()) {
      return ResultT::failure("candidate embedding invalid: " + status.error());
    }
    out[missing[j]] = std::move(embedded.value()[j]);
  }
  return ResultT::success(std::move(out));
}

common::Result<Selection> Reranker::select(const std::string &query,
                                           const std::vector<memory::RetrievedMemory> &candidates,
                                           const RerankerState &state) {
  using ResultT = common::Result<Selection>;
  if (candidates.empty()) {
    return ResultT::success(Selection{});
  }
  if (embedder_ == nullptr) {
    return ResultT::failure("reranker has no embedder");
  }

  const std::size_t dim = embedder_->dimensions();
  if (auto status = validate_state(state, dim); !status.ok()) {
    return ResultT::failure("invalid reranker state: " + status.error());
  }

  try {
    auto query_embedding = embedder_->embed(query);
    if (!query_embedding.ok()) {
      return ResultT::failure("embedding query failed: " + query_embedding.error());
    }
    if (auto status = memory::validate_embedding(query_embedding.value(), dim); !status.ok()) {
      return ResultT::failure("query embedding invalid: " + status.error());
    }
    auto memory_embeddings = candidate_embeddings(candidates);
    if (!memory_embeddings.ok()) {
      return ResultT::failure(memory_embeddings.error());
    }

    SampleTrace trace;
    trace.temperature = state.config.temperature;
    trace.query_embedding = std::move(query_embedding.value());
    trace.transformed_query = state.weights.query_transform.multiply(trace.query_embedding);
    trace.memory_embeddings = std::move(memory_embeddings.value());
    trace.transformed_memories.reserve(candidates.size());
    trace.scores.reserve(candidates.size());
    for (const auto &embedding : trace.memory_embeddings) {
      trace.transformed_memories.push_back(state.weights.memory_transform.multiply(embedding));
      trace.scores.push_back(dot(trace.transformed_query, trace.transformed_memories.back()));
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    trace.selected = gumbel_top_m(trace.scores, state.config.top_m, state.config.temperature,
                                  [this, &unit]() { return unit(rng_); });

    Selection selection;
    selection.memories.reserve(trace.selected.size());
    for (const auto &picked : trace.selected) {
      memory::RetrievedMemory shown = candidates[picked.candidate_index];
      shown.memory.embedding = trace.memory_embeddings[picked.candidate_index];
      selection.memories.push_back(std::move(shown));
    }
    selection.trace = std::move(trace);
    return ResultT::success(std::move(selection));
  } catch (const std::exception &ex) {
    return ResultT::failure(std::string("reranker select threw: ") + ex.what());
  } catch (...) {
    return ResultT::failure("reranker select threw a non-standard exception");
  }
}

} // namespace rmm::reranker
