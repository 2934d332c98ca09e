#include "rmm/pipeline/turn_pipeline.hpp"

#include "rmm/common/id.hpp"
#include "rmm/memory/prompts.hpp"
#include "rmm/observability/factory.hpp"

#include <chrono>
#include <stdexcept>

namespace rmm::pipeline {

namespace {

std::uint64_t resolve_seed(const std::optional<std::uint64_t> &seed) {
  return seed.has_value() ? *seed : common::random_seed();
}

std::shared_ptr<memory::IEmbedder> require_embedder(const PipelineDependencies &deps) {
  if (deps.embedder == nullptr) {
    throw std::invalid_argument("turn pipeline requires an embedder");
  }
  if (deps.embedder->dimensions() != deps.config.reranker.embedding_dimension) {
    throw std::invalid_argument(
        "embedder dimension " + std::to_string(deps.embedder->dimensions()) +
        " does not match reranker.embedding_dimension " +
        std::to_string(deps.config.reranker.embedding_dimension));
  }
  return deps.embedder;
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

std::string last_human_message(const std::vector<memory::StoredMessage> &messages) {
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    if (it->type == "human") {
      return it->content;
    }
  }
  return "";
}

TurnPipeline::TurnPipeline(PipelineDependencies deps)
    : config_(deps.config), embedder_(require_embedder(deps)),
      observer_(deps.observer != nullptr ? deps.observer : observability::noop_observer()),
      retrieval_(deps.index, observer_), reranker_(embedder_, resolve_seed(deps.seed)),
      weights_(deps.store, config_.store.scope, config_.reranker.embedding_dimension, observer_),
      buffers_(deps.store, config_.store.scope, observer_),
      gradients_(deps.store, config_.store.scope, config_.reranker.embedding_dimension, observer_),
      seed_rng_(resolve_seed(deps.seed) ^ 0xA5A5A5A5A5A5A5A5ULL) {
  if (deps.store == nullptr) {
    throw std::invalid_argument("turn pipeline requires a durable store");
  }
  if (deps.index != nullptr && deps.llm != nullptr) {
    auto extractor = std::make_shared<memory::MemoryExtractor>(deps.llm, embedder_, observer_);
    auto consolidator = std::make_shared<memory::MemoryConsolidator>(
        deps.index, deps.llm, observer_, config_.consolidation.similar_k);
    reflection_ = std::make_unique<ProspectiveReflection>(std::move(extractor),
                                                          std::move(consolidator), observer_);
  }
}

void TurnPipeline::warn(std::string component, std::string message) {
  observer_->record_event(observability::WarningEvent{.component = std::move(component),
                                                      .message = std::move(message)});
}

void TurnPipeline::on_turn_start(const TurnContext &context, TurnState &state) {
  state = TurnState{};
  auto loaded = weights_.load_weights(context.user_id);
  if (loaded.has_value()) {
    state.reranker = std::move(*loaded);
  } else {
    state.reranker = reranker::make_initial_state(config_.reranker, seed_rng_());
  }

  if (!config_.reflection.enabled || reflection_ == nullptr) {
    return;
  }
  const auto status = run_reflection(context);
  if (!status.ok()) {
    warn("reflection", "prospective reflection failed for " + context.user_id + ": " +
                           status.error());
  }
}

void TurnPipeline::before_model_call(const TurnContext & /*context*/, TurnState &state,
                                     const std::vector<memory::StoredMessage> &messages) {
  ++state.turn_count;
  state.candidates.clear();
  state.shown.clear();
  state.trace.reset();
  state.citations.clear();

  state.query = last_human_message(messages);
  if (state.query.empty() || !state.reranker.has_value()) {
    return;
  }
  const auto start = std::chrono::steady_clock::now();
  state.candidates = retrieval_.search(state.query, state.reranker->config.top_k);
  observer_->record_metric(
      observability::StageLatencyMetric{.stage = "retrieval", .latency = elapsed_since(start)});
}

common::Result<ModelResponse> TurnPipeline::around_model_call(const TurnContext &context,
                                                              TurnState &state,
                                                              ModelRequest request,
                                                              const ModelHandler &handler) {
  if (state.candidates.empty() || !state.reranker.has_value()) {
    return handler(request);
  }

  const auto start = std::chrono::steady_clock::now();
  auto selection = reranker_.select(state.query, state.candidates, *state.reranker);
  observer_->record_metric(
      observability::StageLatencyMetric{.stage = "rerank", .latency = elapsed_since(start)});
  if (!selection.ok()) {
    observer_->record_event(observability::RetrievalFallbackEvent{
        .component = "reranker", .reason = selection.error()});
    return handler(request);
  }
  observer_->record_event(observability::SelectionEvent{
      .user_id = context.user_id,
      .candidates = state.candidates.size(),
      .selected = selection.value().memories.size(),
  });
  if (selection.value().memories.empty()) {
    return handler(request);
  }

  state.shown = std::move(selection.value().memories);
  state.trace = std::move(selection.value().trace);

  const std::string block = memory::format_memories_block(state.shown);
  request.messages.push_back(memory::StoredMessage{
      .type = "human", .content = memory::citation_prompt(state.query, block)});

  auto response = handler(request);
  if (response.ok()) {
    state.citations = reranker::extract_citations(response.value().content, state.shown.size());
  }
  return response;
}

void TurnPipeline::after_model_call(const TurnContext &context, TurnState &state,
                                    const std::string &answer) {
  if (!state.trace.has_value() || state.trace->selected.empty() || !state.reranker.has_value()) {
    return;
  }

  bool moved = false;
  if (config_.reranker.batch_size <= 1) {
    auto result = reranker::update(*state.trace, answer, *state.reranker,
                                   config_.reranker.clip_threshold);
    state.citations = result.citations;
    if (!result.applied) {
      warn("weight_update", "sample trace did not match reranker state; weights unchanged");
      return;
    }
    state.reranker = std::move(result.state);
    moved = true;
  } else {
    state.citations = reranker::extract_citations(answer, state.trace->selected.size());
    const auto rewards = reranker::compute_rewards(state.citations, state.trace->selected.size());
    auto step = reranker::reinforce_step(*state.reranker, *state.trace, rewards);
    if (!step.ok()) {
      warn("weight_update", "sample trace did not match reranker state: " + step.error());
      return;
    }
    moved = accumulate_step(context, state, step.value());
  }
  observer_->record_metric(observability::CitationRateMetric{.cited = state.citations.size(),
                                                             .shown = state.shown.size()});

  // Saved even when a batch is still filling so the next turn resumes these weights.
  const bool persisted = weights_.save_weights(context.user_id, *state.reranker);
  if (!moved) {
    return;
  }
  observer_->record_event(observability::WeightUpdateEvent{
      .user_id = context.user_id,
      .shown = state.shown.size(),
      .cited = state.citations.size(),
      .persisted = persisted,
  });
}

bool TurnPipeline::accumulate_step(const TurnContext &context, TurnState &state,
                                   const reranker::GradientStep &step) {
  const std::size_t dim = config_.reranker.embedding_dimension;
  auto batch = gradients_.load(context.user_id).value_or(storage::make_empty_accumulator(dim));
  batch.sum.query_transform.add(step.query_transform);
  batch.sum.memory_transform.add(step.memory_transform);
  ++batch.samples;

  bool moved = false;
  if (batch.samples >= config_.reranker.batch_size || context.session_end) {
    auto next = *state.reranker;
    if (const auto status = reranker::apply_step(next, batch.sum, config_.reranker.clip_threshold);
        status.ok()) {
      state.reranker = std::move(next);
      moved = true;
    } else {
      warn("weight_update", "discarding gradient batch: " + status.error());
    }
    batch = storage::make_empty_accumulator(dim, batch.batch_index + 1);
  }

  if (!gradients_.save(context.user_id, batch)) {
    warn("weight_update", "failed to persist gradient batch for " + context.user_id);
  }
  return moved;
}

void TurnPipeline::on_turn_end(const TurnContext &context,
                               const std::vector<memory::StoredMessage> &new_messages) {
  if (new_messages.empty()) {
    return;
  }
  const std::int64_t now = common::now_ms();
  auto buffer = storage::append_messages(buffers_.load_buffer(context.user_id), new_messages, now);
  if (!buffers_.save_buffer(context.user_id, buffer)) {
    warn("buffer", "failed to persist message buffer for " + context.user_id);
  }
}

common::Status TurnPipeline::run_reflection(const TurnContext &context, const bool force) {
  if (reflection_ == nullptr) {
    return common::Status::error("reflection requires a candidate index and an LLM");
  }

  if (auto staged = buffers_.load_staging_buffer(context.user_id); staged.has_value()) {
    return reflect_snapshot(context, std::move(*staged));
  }

  auto item = buffers_.load_buffer_item(context.user_id);
  if (!item.has_value() || item->buffer.messages.empty()) {
    return common::Status::success();
  }
  const std::int64_t since_update = common::now_ms() - item->updated_at;
  if (!force &&
      !should_reflect(item->buffer.human_message_count, since_update, config_.reflection)) {
    return common::Status::success();
  }

  if (!buffers_.stage_buffer(context.user_id, item->buffer)) {
    return common::Status::error("failed to stage message buffer");
  }
  if (!buffers_.clear_buffer(context.user_id)) {
    warn("buffer", "staged buffer for " + context.user_id + " but could not clear the main buffer");
  }
  observer_->record_event(observability::ReflectionEvent{
      .user_id = context.user_id,
      .stage = "staged",
      .detail = std::to_string(item->buffer.messages.size()) + " messages"});
  return reflect_snapshot(context, std::move(item->buffer));
}

common::Status TurnPipeline::reflect_snapshot(const TurnContext &context,
                                              storage::MessageBuffer snapshot) {
  const auto start = std::chrono::steady_clock::now();
  auto report = reflection_->reflect(context.user_id, snapshot.messages, context.session_id);
  observer_->record_metric(
      observability::StageLatencyMetric{.stage = "reflection", .latency = elapsed_since(start)});

  if (report.ok()) {
    if (!buffers_.clear_staging(context.user_id)) {
      warn("buffer", "reflection finished but staging could not be cleared for " +
                         context.user_id);
    }
    observer_->record_event(observability::ReflectionEvent{
        .user_id = context.user_id,
        .stage = "completed",
        .detail = std::to_string(report.value().added) + " added, " +
                  std::to_string(report.value().merged) + " merged"});
    return common::Status::success();
  }

  const std::uint32_t attempts = snapshot.retry_count.value_or(0) + 1;
  if (attempts >= config_.reflection.max_retries) {
    warn("reflection", "dropping staged snapshot for " + context.user_id + " after " +
                           std::to_string(attempts) + " failed attempts");
    if (!buffers_.clear_staging(context.user_id)) {
      warn("buffer", "could not clear staging for " + context.user_id);
    }
  } else {
    snapshot.retry_count = attempts;
    if (!buffers_.stage_buffer(context.user_id, snapshot)) {
      warn("buffer", "could not record retry count for " + context.user_id);
    }
  }
  return common::Status::error(report.error());
}

} // namespace rmm::pipeline
