#pragma once

#include "rmm/config/schema.hpp"
#include "rmm/memory/candidate_index.hpp"
#include "rmm/memory/embedder.hpp"
#include "rmm/memory/retrieval.hpp"
#include "rmm/observability/observer.hpp"
#include "rmm/pipeline/reflection.hpp"
#include "rmm/providers/llm.hpp"
#include "rmm/reranker/reranker.hpp"
#include "rmm/reranker/weight_update.hpp"
#include "rmm/storage/gradient_storage.hpp"
#include "rmm/storage/message_buffer_storage.hpp"
#include "rmm/storage/weight_storage.hpp"
#include "rmm/store/store.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace rmm::pipeline {

/// Runtime context supplied by the host for every stage.
struct TurnContext {
  std::string user_id;
  std::optional<std::string> session_id;
  /// Applies a partially filled gradient batch in after_model_call.
  bool session_end = false;
};

/// Per-turn state threaded through the stages by the host.
struct TurnState {
  std::optional<reranker::RerankerState> reranker;
  std::string query;
  std::vector<memory::RetrievedMemory> candidates;
  std::vector<memory::RetrievedMemory> shown;
  std::optional<reranker::SampleTrace> trace;
  std::vector<reranker::Citation> citations;
  std::size_t turn_count = 0;
};

struct ModelRequest {
  std::vector<memory::StoredMessage> messages;
};

struct ModelResponse {
  std::string content;
};

using ModelHandler = std::function<common::Result<ModelResponse>(const ModelRequest &)>;

struct PipelineDependencies {
  config::Config config;
  std::shared_ptr<memory::IEmbedder> embedder;
  std::shared_ptr<memory::ICandidateIndex> index;
  std::shared_ptr<providers::ILlmClient> llm;
  std::shared_ptr<store::IKeyValueStore> store;
  std::shared_ptr<observability::IObserver> observer;
  /// Sampler and initial-weight seed; drawn from the OS CSPRNG when unset.
  std::optional<std::uint64_t> seed;
};

/// Last "human" message content, or empty.
[[nodiscard]] std::string last_human_message(const std::vector<memory::StoredMessage> &messages);

/// Explicit turn stages for a host conversation loop. Memory subsystem
/// failures never escape a stage; they degrade to "no memories" or "no update".
class TurnPipeline {
public:
  /// Throws std::invalid_argument when the embedder dimension differs from
  /// reranker.embedding_dimension or a required collaborator is missing.
  explicit TurnPipeline(PipelineDependencies deps);

  /// Load (or initialize) the user's reranker state and run prospective
  /// reflection when a staged snapshot exists or the triggers fire.
  void on_turn_start(const TurnContext &context, TurnState &state);

  /// Retrieve top-K candidates for the last human message.
  void before_model_call(const TurnContext &context, TurnState &state,
                         const std::vector<memory::StoredMessage> &messages);

  /// Rerank, expose the selected memories to the model, and record citations.
  /// The handler's own result is returned unchanged.
  [[nodiscard]] common::Result<ModelResponse> around_model_call(const TurnContext &context,
                                                                TurnState &state,
                                                                ModelRequest request,
                                                                const ModelHandler &handler);

  /// REINFORCE step from the answer's citations. With reranker.batch_size > 1
  /// the step is accumulated and the weights move once the batch is full or
  /// the session ends. Updated weights are persisted.
  void after_model_call(const TurnContext &context, TurnState &state, const std::string &answer);

  /// Append the turn's messages to the user's main buffer.
  void on_turn_end(const TurnContext &context,
                   const std::vector<memory::StoredMessage> &new_messages);

  /// Process a leftover staged snapshot, or stage and reflect the main buffer
  /// when `force` is set or the triggers fire.
  [[nodiscard]] common::Status run_reflection(const TurnContext &context, bool force = false);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] storage::WeightStorage &weights() { return weights_; }
  [[nodiscard]] storage::MessageBufferStorage &buffers() { return buffers_; }
  [[nodiscard]] storage::GradientStorage &gradients() { return gradients_; }

private:
  common::Status reflect_snapshot(const TurnContext &context, storage::MessageBuffer snapshot);
  /// Sums the step into the stored batch; true when the weights moved.
  bool accumulate_step(const TurnContext &context, TurnState &state,
                       const reranker::GradientStep &step);
  void warn(std::string component, std::string message);

  config::Config config_;
  std::shared_ptr<memory::IEmbedder> embedder_;
  std::shared_ptr<observability::IObserver> observer_;
  memory::CandidateRetrieval retrieval_;
  reranker::Reranker reranker_;
  storage::WeightStorage weights_;
  storage::MessageBufferStorage buffers_;
  storage::GradientStorage gradients_;
  std::unique_ptr<ProspectiveReflection> reflection_;
  std::mt19937_64 seed_rng_;
};

} // namespace rmm::pipeline
