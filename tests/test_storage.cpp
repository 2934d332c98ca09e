#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "rmm/storage/gradient_storage.hpp"
#include "rmm/storage/message_buffer_storage.hpp"
#include "rmm/storage/weight_storage.hpp"
#include "rmm/store/memory_store.hpp"
#include "rmm/store/sqlite_store.hpp"

#include <cmath>
#include <limits>
#include <memory>

namespace {

namespace st = rmm::storage;
namespace rr = rmm::reranker;

rr::RerankerState seeded_state(const std::size_t dim) {
  rmm::config::RerankerConfig config;
  config.embedding_dimension = dim;
  config.temperature = 0.3;
  config.learning_rate = 1.0 / 3.0;
  auto state = rr::make_initial_state(config, 1234);
  // Values whose shortest decimal form needs all 17 digits.
  state.weights.query_transform.at(0, 1) = 0.1 + 0.2;
  state.weights.memory_transform.at(1, 0) = -std::nextafter(1.0, 2.0);
  return state;
}

} // namespace

void register_storage_tests(std::vector<rmm::tests::TestCase> &tests) {
  using rmm::tests::require;

  tests.push_back({"memory_store_put_get_overwrite", [] {
                     rmm::store::InMemoryStore store;
                     const rmm::store::Namespace ns{"rmm", "u1", "weights"};
                     auto missing = store.get(ns, "reranker");
                     require(missing.ok() && !missing.value().has_value(), "absent key");

                     require(store.put(ns, "reranker", "{\"v\":1}").ok(), "first put");
                     auto first = store.get(ns, "reranker");
                     require(first.ok() && first.value().has_value(), "stored");
                     const auto created = first.value()->created_at;

                     require(store.put(ns, "reranker", "{\"v\":2}").ok(), "second put");
                     auto second = store.get(ns, "reranker");
                     require(second.value()->value == "{\"v\":2}", "last write wins");
                     require(second.value()->created_at == created, "created_at kept");
                     require(store.size() == 1, "single item");
                     require(!store.get({"rmm", "u2", "weights"}, "reranker").value().has_value(),
                             "other namespace empty");
                   }});

  tests.push_back({"namespace_key_is_json_array", [] {
                     require(rmm::store::namespace_key({"rmm", "u\"1", "buffer"}) ==
                                 R"(["rmm","u\"1","buffer"])",
                             rmm::store::namespace_key({"rmm", "u\"1", "buffer"}));
                   }});

  tests.push_back({"sqlite_store_persists_across_instances", [] {
                     rmm::testing::TempDir dir;
                     const auto path = dir.path() / "nested" / "rmm.db";
                     const rmm::store::Namespace ns{"rmm", "u1", "buffer"};
                     {
                       rmm::store::SqliteStore store(path);
                       require(store.open_error().empty(), store.open_error());
                       require(store.put(ns, "message-buffer", "first").ok(), "put");
                       require(store.put(ns, "message-buffer", "second").ok(), "overwrite");
                     }
                     rmm::store::SqliteStore reopened(path);
                     require(reopened.open_error().empty(), reopened.open_error());
                     auto item = reopened.get(ns, "message-buffer");
                     require(item.ok(), item.error());
                     require(item.value().has_value() && item.value()->value == "second",
                             "value persisted");
                     require(item.value()->updated_at >= item.value()->created_at, "timestamps");
                     auto other = reopened.get({"rmm", "u1", "weights"}, "message-buffer");
                     require(other.ok() && !other.value().has_value(), "namespaces isolated");
                   }});

  tests.push_back({"create_store_selects_backend", [] {
                     rmm::config::StoreConfig config;
                     config.backend = "memory";
                     auto memory = rmm::store::create_store(config);
                     require(memory.ok() && memory.value()->name() == "memory", "memory backend");

                     rmm::testing::TempDir dir;
                     config.backend = "sqlite";
                     config.path = (dir.path() / "store.db").string();
                     auto sqlite = rmm::store::create_store(config);
                     require(sqlite.ok(), sqlite.error());
                     require(sqlite.value()->name() == "sqlite", "sqlite backend");

                     config.backend = "redis";
                     require(!rmm::store::create_store(config).ok(), "unknown backend");
                   }});

  tests.push_back({"weights_roundtrip_bitwise", [] {
                     auto store = std::make_shared<rmm::store::InMemoryStore>();
                     st::WeightStorage storage(store, "rmm", 4);
                     const auto state = seeded_state(4);
                     require(storage.save_weights("u1", state), "save");

                     const auto loaded = storage.load_weights("u1");
                     require(loaded.has_value(), "load");
                     require(loaded->weights == state.weights, "weights bit-identical");
                     require(loaded->config == state.config, "config bit-identical");
                     require(loaded->updated_at.has_value() && *loaded->updated_at > 0,
                             "updatedAt stamped");
                     require(!storage.load_weights("u2").has_value(), "per-user isolation");

                     const auto stored = store->get(storage.namespace_for("u1"), st::kWeightsKey);
                     require(stored.value()->value.find("\"queryTransform\"") !=
                                 std::string::npos,
                             "camelCase layout");
                   }});

  tests.push_back({"weights_with_wrong_dimension_are_ignored", [] {
                     auto store = std::make_shared<rmm::store::InMemoryStore>();
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     st::WeightStorage writer(store, "rmm", 4);
                     require(writer.save_weights("u1", seeded_state(4)), "save");

                     st::WeightStorage reader(store, "rmm", 8, observer);
                     require(!reader.load_weights("u1").has_value(), "mismatch gives nullopt");
                     require(observer->count<rmm::observability::WarningEvent>() == 1,
                             "invalid data warned");

                     require(!writer.save_weights("u1", seeded_state(3)),
                             "wrong shape not saved");
                     require(writer.load_weights("u1").has_value(), "previous state intact");
                   }});

  tests.push_back({"invalid_stored_records_are_ignored_not_deleted", [] {
                     auto store = std::make_shared<rmm::store::InMemoryStore>();
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     st::WeightStorage weights(store, "rmm", 4, observer);
                     require(weights.save_weights("u1", seeded_state(4)), "save");

                     const auto ns = weights.namespace_for("u1");
                     std::string payload = store->get(ns, st::kWeightsKey).value()->value;
                     const std::string field = R"("topK":20)";
                     const auto at = payload.find(field);
                     require(at != std::string::npos, "topK serialized");
                     payload.replace(at, field.size(), R"("topK":1e300)");
                     require(store->put(ns, st::kWeightsKey, payload).ok(), "corrupt");

                     require(!weights.load_weights("u1").has_value(), "out-of-range topK ignored");
                     require(store->get(ns, st::kWeightsKey).value()->value == payload,
                             "weights record left in place");

                     st::MessageBufferStorage buffers(store, "rmm", observer);
                     const std::string bad_buffer =
                         R"({"messages":[],"humanMessageCount":0,"lastMessageTimestamp":5,)"
                         R"("createdAt":4,"retryCount":1e12})";
                     require(store->put(buffers.namespace_for("u1", false), st::kBufferKey, bad_buffer)
                                 .ok(),
                             "seed main");
                     require(store->put(buffers.namespace_for("u1", true), st::kBufferKey,
                                        "{not json")
                                 .ok(),
                             "seed staging");

                     require(buffers.load_buffer("u1").messages.empty(), "bad main reads empty");
                     require(!buffers.load_staging_buffer("u1").has_value(),
                             "bad staging reads absent");
                     require(store->get(buffers.namespace_for("u1", false), st::kBufferKey)
                                     .value()
                                     ->value == bad_buffer,
                             "main record left in place");
                     require(store->get(buffers.namespace_for("u1", true), st::kBufferKey)
                                     .value()
                                     ->value == "{not json",
                             "staging record left in place");
                     require(observer->count<rmm::observability::WarningEvent>() == 3,
                             "each invalid read warned");
                   }});

  tests.push_back({"invalid_weights_are_not_written", [] {
                     auto store = std::make_shared<rmm::testing::FlakyStore>();
                     st::WeightStorage storage(store, "rmm", 4);
                     auto state = seeded_state(4);
                     state.weights.query_transform.at(2, 2) =
                         std::numeric_limits<double>::quiet_NaN();
                     require(!storage.save_weights("u1", state), "NaN rejected");
                     state = seeded_state(4);
                     state.config.temperature = -1.0;
                     require(!storage.save_weights("u1", state), "bad config rejected");
                     require(store->put_calls == 0, "nothing written");
                   }});

  tests.push_back({"weight_storage_survives_store_failures", [] {
                     auto store = std::make_shared<rmm::testing::FlakyStore>();
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     st::WeightStorage storage(store, "rmm", 4, observer);

                     store->writes = rmm::testing::StoreFailure::Error;
                     require(!storage.save_weights("u1", seeded_state(4)), "write error");
                     store->writes = rmm::testing::StoreFailure::Throw;
                     require(!storage.save_weights("u1", seeded_state(4)), "write throw");
                     store->reads = rmm::testing::StoreFailure::Throw;
                     require(!storage.load_weights("u1").has_value(), "read throw");
                     store->reads = rmm::testing::StoreFailure::Error;
                     require(!storage.load_weights("u1").has_value(), "read error");
                     store->writes = rmm::testing::StoreFailure::ThrowValue;
                     require(!storage.save_weights("u1", seeded_state(4)), "write throws int");
                     store->reads = rmm::testing::StoreFailure::ThrowValue;
                     require(!storage.load_weights("u1").has_value(), "read throws int");
                     require(observer->count<rmm::observability::PersistenceFailureEvent>() == 6,
                             "each failure reported");

                     store->reads = rmm::testing::StoreFailure::None;
                     store->seed(storage.namespace_for("u1"), st::kWeightsKey, "{not json");
                     require(!storage.load_weights("u1").has_value(), "corrupt data ignored");
                   }});

  tests.push_back({"gradient_accumulator_roundtrip_and_validation", [] {
                     auto store = std::make_shared<rmm::testing::FlakyStore>();
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     st::GradientStorage storage(store, "rmm", 3, observer);
                     require(!storage.load("u1").has_value(), "nothing stored yet");
                     require(storage.namespace_for("u1") ==
                                 rmm::store::Namespace{"rmm", "u1", "gradients"},
                             "namespace");

                     auto batch = st::make_empty_accumulator(3, 4);
                     batch.sum.query_transform.at(0, 2) = 0.1 + 0.2;
                     batch.sum.memory_transform.at(2, 1) = -1e-300;
                     batch.samples = 2;
                     require(storage.save("u1", batch), "save");
                     const auto loaded = storage.load("u1");
                     require(loaded.has_value(), "load");
                     require(loaded->samples == 2 && loaded->batch_index == 4, "counters");
                     require(loaded->sum.query_transform == batch.sum.query_transform &&
                                 loaded->sum.memory_transform == batch.sum.memory_transform,
                             "gradients bit-identical");

                     st::GradientStorage wider(store, "rmm", 4, observer);
                     require(!wider.load("u1").has_value(), "dimension mismatch ignored");
                     require(observer->count<rmm::observability::WarningEvent>() == 1, "warned");
                     require(!wider.save("u1", batch), "wrong shape not saved");

                     batch.sum.memory_transform.at(0, 0) =
                         std::numeric_limits<double>::infinity();
                     require(!storage.save("u1", batch), "non-finite not saved");
                     require(storage.load("u1")->samples == 2, "previous batch intact");

                     store->writes = rmm::testing::StoreFailure::ThrowValue;
                     require(!storage.save("u1", st::make_empty_accumulator(3)), "write throw");
                     store->reads = rmm::testing::StoreFailure::Error;
                     require(!storage.load("u1").has_value(), "read error");
                   }});

  tests.push_back({"buffer_append_and_roundtrip", [] {
                     auto store = std::make_shared<rmm::store::InMemoryStore>();
                     st::MessageBufferStorage storage(store, "rmm");

                     const auto empty = storage.load_buffer("u1");
                     require(empty.messages.empty() && empty.human_message_count == 0,
                             "missing buffer is empty");

                     auto buffer = st::append_messages(
                         empty, {{.type = "human", .content = "hello"}}, 1000);
                     require(storage.save_buffer("u1", buffer), "save");
                     auto loaded = storage.load_buffer("u1");
                     require(loaded.messages.size() == 1, "one message");
                     require(loaded.messages[0] ==
                                 rmm::memory::StoredMessage{.type = "human", .content = "hello"},
                             "message kept");
                     require(loaded.human_message_count == 1, "human counted");
                     require(loaded.last_message_timestamp == 1000, "timestamp");

                     loaded = st::append_messages(
                         loaded,
                         {{.type = "ai", .content = "hi \"there\"\n"},
                          {.type = "human", .content = "bye"}},
                         2000);
                     require(storage.save_buffer("u1", loaded), "save again");
                     const auto reloaded = storage.load_buffer("u1");
                     require(reloaded.messages.size() == 3, "three messages");
                     require(reloaded.messages[1].content == "hi \"there\"\n", "escaping");
                     require(reloaded.human_message_count == 2, "two humans");
                     require(!reloaded.retry_count.has_value(), "no retries recorded");

                     require(storage.load_buffer("u2").messages.empty(), "per-user isolation");
                     require(storage.save_buffer(
                                 "u2", st::append_messages(st::MessageBuffer{},
                                                           {{.type = "human", .content = "other"}},
                                                           3000)),
                             "save second user");
                     require(storage.load_buffer("u2").messages[0].content == "other",
                             "second user content");
                     require(storage.load_buffer("u1").messages[0].content == "hello",
                             "first user untouched");
                     const auto item = storage.load_buffer_item("u1");
                     require(item.has_value() && item->updated_at > 0, "store timestamp exposed");
                   }});

  tests.push_back({"buffer_staging_lifecycle", [] {
                     auto store = std::make_shared<rmm::store::InMemoryStore>();
                     st::MessageBufferStorage storage(store, "rmm");
                     require(!storage.load_staging_buffer("u1").has_value(), "nothing staged");

                     auto buffer = st::append_messages(st::make_empty_buffer(10),
                                                       {{.type = "human", .content = "hello"}}, 20);
                     buffer.retry_count = 2;
                     require(storage.stage_buffer("u1", buffer), "stage");
                     const auto staged = storage.load_staging_buffer("u1");
                     require(staged.has_value() && staged->messages.size() == 1, "staged copy");
                     require(staged->retry_count.value_or(0) == 2, "retry count kept");
                     require(storage.load_buffer("u1").messages.empty(),
                             "staging separate from main");

                     require(storage.clear_staging("u1"), "clear");
                     require(!storage.load_staging_buffer("u1").has_value(),
                             "cleared staging reads as absent");

                     require(storage.save_buffer("u1", buffer), "save main");
                     require(storage.clear_buffer("u1"), "clear main");
                     require(storage.load_buffer("u1").messages.empty(), "main cleared");
                   }});

  tests.push_back({"buffer_parse_rejects_invalid", [] {
                     require(!st::parse_buffer("{}").ok(), "no messages");
                     require(!st::parse_buffer(R"({"messages":[{"type":"human"}],)"
                                               R"("humanMessageCount":1,)"
                                               R"("lastMessageTimestamp":1,"createdAt":1})")
                                  .ok(),
                             "missing content");
                     require(!st::parse_buffer(R"({"messages":[],"humanMessageCount":-1,)"
                                               R"("lastMessageTimestamp":1,"createdAt":1})")
                                  .ok(),
                             "negative count");
                     auto ok = st::parse_buffer(R"({"messages":[],"humanMessageCount":0,)"
                                                R"("lastMessageTimestamp":5,"createdAt":4,)"
                                                R"("retryCount":1})");
                     require(ok.ok(), ok.error());
                     require(ok.value().retry_count == std::optional<std::uint32_t>(1), "retry");
                     require(!st::parse_buffer(R"({"messages":[],"humanMessageCount":0,)"
                                               R"("lastMessageTimestamp":5,"createdAt":4,)"
                                               R"("retryCount":4294967296})")
                                  .ok(),
                             "retryCount beyond 32 bits");
                   }});

  tests.push_back({"buffer_storage_survives_store_failures", [] {
                     auto store = std::make_shared<rmm::testing::FlakyStore>();
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     st::MessageBufferStorage storage(store, "rmm", observer);

                     store->reads = rmm::testing::StoreFailure::Throw;
                     require(storage.load_buffer("u1").messages.empty(), "empty on throw");
                     require(!storage.load_staging_buffer("u1").has_value(), "no staging");
                     store->writes = rmm::testing::StoreFailure::Error;
                     require(!storage.save_buffer("u1", st::make_empty_buffer(1)), "save fails");
                     require(!storage.stage_buffer("u1", st::make_empty_buffer(1)),
                             "stage fails");
                     store->reads = rmm::testing::StoreFailure::ThrowValue;
                     store->writes = rmm::testing::StoreFailure::ThrowValue;
                     require(storage.load_buffer("u1").messages.empty(), "empty on int throw");
                     require(!storage.save_buffer("u1", st::make_empty_buffer(1)),
                             "save fails on int throw");
                     require(observer->count<rmm::observability::PersistenceFailureEvent>() == 6,
                             "failures reported");

                     auto bad = st::make_empty_buffer(1);
                     bad.messages.push_back({.type = "", .content = "x"});
                     store->writes = rmm::testing::StoreFailure::None;
                     require(!storage.save_buffer("u1", bad), "invalid buffer rejected");
                   }});
}
