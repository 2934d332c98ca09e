#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "rmm/pipeline/factory.hpp"
#include "rmm/pipeline/reflection.hpp"
#include "rmm/pipeline/turn_pipeline.hpp"
#include "rmm/store/memory_store.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace {

namespace pl = rmm::pipeline;
namespace mem = rmm::memory;

const char *kExtraction =
    R"({"extracted_memories":[{"summary":"Enjoys green tea","reference":[0]}]})";

struct Harness {
  std::shared_ptr<rmm::testing::FakeEmbedder> embedder =
      std::make_shared<rmm::testing::FakeEmbedder>(4);
  std::shared_ptr<rmm::testing::ScriptedIndex> index =
      std::make_shared<rmm::testing::ScriptedIndex>();
  std::shared_ptr<rmm::testing::ScriptedLlm> llm = std::make_shared<rmm::testing::ScriptedLlm>();
  std::shared_ptr<rmm::store::InMemoryStore> store = std::make_shared<rmm::store::InMemoryStore>();
  std::shared_ptr<rmm::testing::RecordingObserver> observer =
      std::make_shared<rmm::testing::RecordingObserver>();
  rmm::config::Config config = rmm::testing::test_config(4);

  Harness() {
    embedder->set_vector("what do I like?", {1.0, 0.0, 0.0, 0.0});
    index->matches = {
        match("m0", "Likes tea", {0.9, 0.1, 0.0, 0.0}),
        match("m1", "Owns a bike", {0.1, 0.9, 0.0, 0.0}),
        match("m2", "Reads novels", {0.5, 0.0, 0.5, 0.0}),
    };
  }

  mem::IndexMatch match(const std::string &id, const std::string &summary,
                        std::vector<double> vector) {
    embedder->set_vector(summary, std::move(vector));
    return mem::IndexMatch{.content = summary,
                           .metadata = {.id = id,
                                        .session_id = "s0",
                                        .turn_references = std::vector<int>{0},
                                        .timestamp = 10,
                                        .raw_dialogue = "I said: " + summary},
                           .score = 0.5};
  }

  std::unique_ptr<pl::TurnPipeline> build(bool with_llm = true) {
    return std::make_unique<pl::TurnPipeline>(pl::PipelineDependencies{
        .config = config,
        .embedder = embedder,
        .index = index,
        .llm = with_llm ? std::shared_ptr<rmm::providers::ILlmClient>(llm) : nullptr,
        .store = store,
        .observer = observer,
        .seed = 7,
    });
  }
};

std::vector<mem::StoredMessage> question() {
  return {{.type = "human", .content = "what do I like?"}};
}

std::vector<mem::StoredMessage> exchange(const std::string &human, const std::string &ai) {
  return {{.type = "human", .content = human}, {.type = "ai", .content = ai}};
}

} // namespace

void register_pipeline_tests(std::vector<rmm::tests::TestCase> &tests) {
  using rmm::tests::require;

  tests.push_back({"should_reflect_strict_and_relaxed", [] {
                     rmm::config::ReflectionConfig config;
                     config.mode = "strict";
                     require(pl::should_reflect(2, 600'000, config), "both minimums");
                     require(!pl::should_reflect(2, 0, config), "turns only");
                     require(!pl::should_reflect(0, 600'000, config), "inactivity only");
                     require(pl::should_reflect(50, 0, config), "max turns forces");
                     require(pl::should_reflect(0, 1'800'000, config), "max inactivity forces");

                     config.mode = "relaxed";
                     require(pl::should_reflect(2, 0, config), "turns suffice");
                     require(pl::should_reflect(0, 600'000, config), "inactivity suffices");
                     require(!pl::should_reflect(1, 100, config), "neither minimum");
                   }});

  tests.push_back({"last_human_message_picks_latest", [] {
                     std::vector<mem::StoredMessage> messages = {
                         {.type = "human", .content = "first"},
                         {.type = "ai", .content = "reply"},
                         {.type = "human", .content = "second"},
                         {.type = "tool", .content = "output"}};
                     require(pl::last_human_message(messages) == "second", "latest human");
                     require(pl::last_human_message({{.type = "ai", .content = "x"}}).empty(),
                             "no human");
                   }});

  tests.push_back({"pipeline_constructor_validates_dependencies", [] {
                     Harness harness;
                     harness.config.reranker.embedding_dimension = 8;
                     bool threw = false;
                     try {
                       (void)harness.build();
                     } catch (const std::invalid_argument &) {
                       threw = true;
                     }
                     require(threw, "dimension mismatch throws");

                     Harness no_store;
                     no_store.store = nullptr;
                     threw = false;
                     try {
                       (void)pl::TurnPipeline(pl::PipelineDependencies{
                           .config = no_store.config, .embedder = no_store.embedder});
                     } catch (const std::invalid_argument &) {
                       threw = true;
                     }
                     require(threw, "missing store throws");
                   }});

  tests.push_back({"full_turn_selects_cites_and_persists", [] {
                     Harness harness;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1", .session_id = "s1"};

                     pl::TurnState state;
                     pipeline->on_turn_start(ctx, state);
                     require(state.reranker.has_value(), "reranker initialized");
                     const auto initial = state.reranker->weights;

                     pipeline->before_model_call(ctx, state, question());
                     require(state.query == "what do I like?", "query");
                     require(state.candidates.size() == 3, "candidates retrieved");
                     require(harness.index->queries.back() == "what do I like?", "index queried");

                     pl::ModelRequest seen;
                     auto response = pipeline->around_model_call(
                         ctx, state, pl::ModelRequest{.messages = question()},
                         [&seen](const pl::ModelRequest &request) {
                           seen = request;
                           return rmm::common::Result<pl::ModelResponse>::success(
                               pl::ModelResponse{.content = "You like tea [0]."});
                         });
                     require(response.ok(), response.error());
                     require(response.value().content == "You like tea [0].", "unchanged answer");
                     require(state.shown.size() == 2, "top_m shown");
                     require(seen.messages.size() == 2, "memory prompt appended");
                     const auto &prompt = seen.messages.back().content;
                     require(prompt.find("<memories>") != std::string::npos, "memories block");
                     require(prompt.find("– Memory [1]:") != std::string::npos, "two entries");
                     require(prompt.find("what do I like?") != std::string::npos, "query quoted");
                     require(state.citations.size() == 1 && state.citations[0].index == 0,
                             "citation recorded");

                     pipeline->after_model_call(ctx, state, response.value().content);
                     require(!(state.reranker->weights == initial), "weights updated");
                     require(harness.observer->count<rmm::observability::SelectionEvent>() == 1,
                             "selection event");
                     require(harness.observer->count<rmm::observability::WeightUpdateEvent>() == 1,
                             "update event");
                     require(harness.observer
                                     ->metric_count<rmm::observability::CitationRateMetric>() == 1,
                             "citation metric");

                     const auto stored = pipeline->weights().load_weights("u1");
                     require(stored.has_value(), "weights persisted");
                     require(stored->weights == state.reranker->weights, "persisted state");

                     pl::TurnState next;
                     pipeline->on_turn_start(ctx, next);
                     require(next.reranker->weights == state.reranker->weights,
                             "next turn resumes learned weights");
                     require(!pipeline->weights().load_weights("u2").has_value(),
                             "other users untouched");
                   }});

  tests.push_back({"turn_without_citations_still_updates", [] {
                     Harness harness;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pl::TurnState state;
                     pipeline->on_turn_start(ctx, state);
                     pipeline->before_model_call(ctx, state, question());
                     auto response = pipeline->around_model_call(
                         ctx, state, pl::ModelRequest{.messages = question()},
                         [](const pl::ModelRequest &) {
                           return rmm::common::Result<pl::ModelResponse>::success(
                               pl::ModelResponse{.content = "No idea. [NO_CITE]"});
                         });
                     require(response.ok(), response.error());
                     require(state.citations.empty(), "nothing cited");
                     pipeline->after_model_call(ctx, state, response.value().content);
                     require(harness.observer->count<rmm::observability::WeightUpdateEvent>() == 1,
                             "update ran with zero rewards");
                     require(pipeline->weights().load_weights("u1").has_value(), "persisted");
                   }});

  tests.push_back({"batched_updates_wait_for_a_full_batch", [] {
                     Harness harness;
                     harness.config.reranker.batch_size = 3;
                     auto pipeline = harness.build();

                     const auto run_turn = [&pipeline](const pl::TurnContext &ctx) {
                       pl::TurnState state;
                       pipeline->on_turn_start(ctx, state);
                       pipeline->before_model_call(ctx, state, question());
                       auto response = pipeline->around_model_call(
                           ctx, state, pl::ModelRequest{.messages = question()},
                           [](const pl::ModelRequest &) {
                             return rmm::common::Result<pl::ModelResponse>::success(
                                 pl::ModelResponse{.content = "You like tea [0]."});
                           });
                       require(response.ok(), response.error());
                       const auto before = state.reranker->weights;
                       pipeline->after_model_call(ctx, state, response.value().content);
                       return std::make_pair(before, state.reranker->weights);
                     };

                     const pl::TurnContext ctx{.user_id = "u1"};
                     const auto first = run_turn(ctx);
                     require(first.first == first.second, "first turn only accumulates");
                     auto batch = pipeline->gradients().load("u1");
                     require(batch.has_value() && batch->samples == 1, "one sample stored");
                     const auto stored = pipeline->weights().load_weights("u1");
                     require(stored.has_value() && stored->weights == first.first,
                             "unchanged weights persisted for the next turn");

                     const auto second = run_turn(ctx);
                     require(second.first == first.second, "second turn resumes stored weights");
                     require(second.first == second.second, "second turn only accumulates");
                     require(pipeline->gradients().load("u1")->samples == 2, "two samples");
                     require(harness.observer->count<rmm::observability::WeightUpdateEvent>() == 0,
                             "no update yet");

                     const auto third = run_turn(ctx);
                     require(!(third.first == third.second), "full batch moves the weights");
                     batch = pipeline->gradients().load("u1");
                     require(batch.has_value() && batch->samples == 0 && batch->batch_index == 1,
                             "batch cleared after applying");
                     require(pipeline->weights().load_weights("u1")->weights == third.second,
                             "applied weights persisted");
                     require(harness.observer->count<rmm::observability::WeightUpdateEvent>() == 1,
                             "one update event");

                     const auto ending = run_turn(pl::TurnContext{.user_id = "u1",
                                                                  .session_id = std::nullopt,
                                                                  .session_end = true});
                     require(!(ending.first == ending.second), "session end flushes the batch");
                     require(pipeline->gradients().load("u1")->samples == 0, "flushed");
                     require(pipeline->gradients().load("u1")->batch_index == 2, "second batch");
                   }});

  tests.push_back({"retrieval_failure_degrades_to_plain_call", [] {
                     Harness harness;
                     harness.index->mode = rmm::testing::IndexMode::Throw;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pl::TurnState state;
                     pipeline->on_turn_start(ctx, state);
                     pipeline->before_model_call(ctx, state, question());
                     require(state.candidates.empty(), "no candidates");

                     std::size_t message_count = 0;
                     auto response = pipeline->around_model_call(
                         ctx, state, pl::ModelRequest{.messages = question()},
                         [&message_count](const pl::ModelRequest &request) {
                           message_count = request.messages.size();
                           return rmm::common::Result<pl::ModelResponse>::success(
                               pl::ModelResponse{.content = "plain"});
                         });
                     require(response.ok(), response.error());
                     require(message_count == 1, "request passed through unchanged");
                     pipeline->after_model_call(ctx, state, "plain");
                     require(harness.observer->count<rmm::observability::WeightUpdateEvent>() == 0,
                             "no update without a selection");
                     require(!pipeline->weights().load_weights("u1").has_value(),
                             "nothing persisted");
                   }});

  tests.push_back({"handler_failure_is_returned_unchanged", [] {
                     Harness harness;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pl::TurnState state;
                     pipeline->on_turn_start(ctx, state);
                     pipeline->before_model_call(ctx, state, question());
                     auto response = pipeline->around_model_call(
                         ctx, state, pl::ModelRequest{.messages = question()},
                         [](const pl::ModelRequest &) {
                           return rmm::common::Result<pl::ModelResponse>::failure("model down");
                         });
                     require(!response.ok() && response.error() == "model down", "error kept");
                     require(state.citations.empty(), "no citations");
                   }});

  tests.push_back({"turn_end_appends_to_buffer", [] {
                     Harness harness;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pipeline->on_turn_end(ctx, exchange("hello", "hi"));
                     pipeline->on_turn_end(ctx, exchange("I like tea", "noted"));
                     pipeline->on_turn_end(ctx, {});
                     const auto buffer = pipeline->buffers().load_buffer("u1");
                     require(buffer.messages.size() == 4, "four messages");
                     require(buffer.human_message_count == 2, "two human messages");
                     require(buffer.messages[2].content == "I like tea", "order kept");
                     require(pipeline->buffers().load_buffer("u2").messages.empty(),
                             "per-user buffers");
                   }});

  tests.push_back({"reflection_waits_for_triggers", [] {
                     Harness harness;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pipeline->on_turn_end(ctx, exchange("hello", "hi"));
                     require(pipeline->run_reflection(ctx).ok(), "no-op succeeds");
                     require(harness.llm->prompts.empty(), "LLM not called");
                     require(pipeline->buffers().load_buffer("u1").messages.size() == 2,
                             "buffer untouched");
                   }});

  tests.push_back({"forced_reflection_adds_memories_and_clears_buffers", [] {
                     Harness harness;
                     harness.index->matches.clear();
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1", .session_id = "s1"};
                     pipeline->on_turn_end(ctx, exchange("I love green tea", "Nice"));
                     harness.llm->push_response(kExtraction);

                     const auto status = pipeline->run_reflection(ctx, true);
                     require(status.ok(), status.error());
                     require(harness.index->added.size() == 1, "memory added");
                     require(harness.index->added[0].content == "Enjoys green tea", "summary");
                     require(harness.index->added[0].raw_dialogue == "I love green tea",
                             "dialogue from referenced turn");
                     require(harness.index->added[0].session_id == "s1", "session id");
                     require(pipeline->buffers().load_buffer("u1").messages.empty(),
                             "main buffer cleared");
                     require(!pipeline->buffers().load_staging_buffer("u1").has_value(),
                             "staging cleared");
                     require(harness.observer->count<rmm::observability::ReflectionEvent>() >= 2,
                             "reflection events");
                   }});

  tests.push_back({"on_turn_start_reflects_when_triggered", [] {
                     Harness harness;
                     harness.index->matches.clear();
                     harness.config.reflection.mode = "relaxed";
                     harness.config.reflection.min_turns = 1;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pipeline->on_turn_end(ctx, exchange("I love green tea", "Nice"));
                     harness.llm->push_response(kExtraction);

                     pl::TurnState state;
                     pipeline->on_turn_start(ctx, state);
                     require(harness.llm->prompts.size() == 1, "extraction ran");
                     require(harness.index->added.size() == 1, "memory added");
                     require(pipeline->buffers().load_buffer("u1").messages.empty(),
                             "buffer consumed");
                   }});

  tests.push_back({"failed_reflection_retries_then_drops", [] {
                     Harness harness;
                     harness.config.reflection.max_retries = 3;
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pipeline->on_turn_end(ctx, exchange("hello", "hi"));
                     harness.llm->set_failure("llm offline");

                     require(!pipeline->run_reflection(ctx, true).ok(), "first attempt fails");
                     require(pipeline->buffers().load_buffer("u1").messages.empty(),
                             "main buffer cleared once staged");
                     auto staged = pipeline->buffers().load_staging_buffer("u1");
                     require(staged.has_value() && staged->retry_count.value_or(0) == 1,
                             "retry count 1");

                     require(!pipeline->run_reflection(ctx).ok(), "second attempt fails");
                     staged = pipeline->buffers().load_staging_buffer("u1");
                     require(staged.has_value() && staged->retry_count.value_or(0) == 2,
                             "retry count 2");

                     require(!pipeline->run_reflection(ctx).ok(), "third attempt fails");
                     require(!pipeline->buffers().load_staging_buffer("u1").has_value(),
                             "snapshot dropped after max retries");
                     require(harness.llm->prompts.size() == 3, "three extraction attempts");
                   }});

  tests.push_back({"staged_snapshot_recovers_on_next_run", [] {
                     Harness harness;
                     harness.index->matches.clear();
                     auto pipeline = harness.build();
                     const pl::TurnContext ctx{.user_id = "u1"};
                     pipeline->on_turn_end(ctx, exchange("I love green tea", "Nice"));

                     harness.llm->set_failure("llm offline");
                     require(!pipeline->run_reflection(ctx, true).ok(), "first attempt fails");
                     pipeline->on_turn_end(ctx, exchange("new turn", "ok"));

                     harness.llm->set_failure(std::nullopt);
                     harness.llm->push_response(kExtraction);
                     const auto status = pipeline->run_reflection(ctx);
                     require(status.ok(), status.error());
                     require(harness.index->added.size() == 1, "staged memories added");
                     require(!pipeline->buffers().load_staging_buffer("u1").has_value(),
                             "staging cleared");
                     require(pipeline->buffers().load_buffer("u1").messages.size() == 2,
                             "newer messages stay in the main buffer");
                   }});

  tests.push_back({"reflection_requires_llm_and_index", [] {
                     Harness harness;
                     auto pipeline = harness.build(false);
                     const pl::TurnContext ctx{.user_id = "u1"};
                     require(!pipeline->run_reflection(ctx, true).ok(), "not configured");

                     pl::TurnState state;
                     pipeline->on_turn_start(ctx, state);
                     require(state.reranker.has_value(), "turns still work");
                   }});

  tests.push_back({"create_pipeline_from_config", [] {
                     auto config = rmm::testing::test_config(8);
                     auto pipeline = pl::create_pipeline(config);
                     require(pipeline.ok(), pipeline.error());
                     require(pipeline.value()->config().reranker.embedding_dimension == 8,
                             "config kept");

                     const pl::TurnContext ctx{.user_id = "u1"};
                     pl::TurnState state;
                     pipeline.value()->on_turn_start(ctx, state);
                     require(state.reranker.has_value() &&
                                 state.reranker->weights.query_transform.rows() == 8,
                             "initial weights sized from config");

                     config.reranker.top_m = 10;
                     require(!pl::create_pipeline(config).ok(), "invalid config rejected");

                     config = rmm::testing::test_config(8);
                     config.embedding.provider = "openai";
                     config.embedding.api_key = std::nullopt;
                     require(!pl::create_pipeline(config).ok(), "missing embedding key");
                   }});
}
