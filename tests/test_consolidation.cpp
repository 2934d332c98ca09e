#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "rmm/memory/consolidation.hpp"
#include "rmm/memory/vector_bank.hpp"

#include <memory>

namespace {

namespace mem = rmm::memory;

mem::MemoryEntry new_memory(const std::string &summary) {
  return mem::MemoryEntry{.id = "new-1",
                          .topic_summary = summary,
                          .raw_dialogue = "I said " + summary,
                          .timestamp = 500,
                          .session_id = "s9",
                          .embedding = {},
                          .turn_references = {2}};
}

mem::IndexMatch neighbour(const std::string &id, const std::string &summary) {
  return mem::IndexMatch{.content = summary,
                         .metadata = {.id = id,
                                      .session_id = "s1",
                                      .turn_references = std::vector<int>{0, 1},
                                      .timestamp = 100,
                                      .raw_dialogue = "old dialogue"},
                         .score = 0.8};
}

} // namespace

void register_consolidation_tests(std::vector<rmm::tests::TestCase> &tests) {
  using rmm::tests::require;

  tests.push_back({"parse_update_actions_accepts_add_and_merge", [] {
                     const auto actions = mem::parse_update_actions(
                         "Add()\n  Merge(1, Enjoys hiking (mostly in spring))  \nnoise", 2);
                     require(actions.size() == 2, "two actions");
                     require(std::holds_alternative<mem::AddAction>(actions[0]), "add first");
                     const auto &merge = std::get<mem::MergeAction>(actions[1]);
                     require(merge.index == 1, "index");
                     require(merge.merged_summary == "Enjoys hiking (mostly in spring)",
                             "parentheses inside summary survive: " + merge.merged_summary);
                   }});

  tests.push_back({"parse_update_actions_drops_invalid_lines", [] {
                     require(mem::parse_update_actions("Merge(2, too far)", 2).empty(),
                             "index out of range");
                     require(mem::parse_update_actions("Merge(0, )", 2).empty(), "empty summary");
                     require(mem::parse_update_actions("Merge(x, bad)", 2).empty(), "non-digit");
                     require(mem::parse_update_actions("merge(0, lower)", 2).empty(),
                             "case sensitive");
                     require(mem::parse_update_actions("Merge(99999999999, big)", 2).empty(),
                             "huge index");
                     require(mem::parse_update_actions("", 2).empty(), "empty output");
                   }});

  tests.push_back({"consolidation_with_empty_index_adds_once", [] {
                     auto embedder = std::make_shared<rmm::testing::FakeEmbedder>(3);
                     auto bank = std::make_shared<mem::VectorMemoryBank>(embedder);
                     auto llm = std::make_shared<rmm::testing::ScriptedLlm>();
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     mem::MemoryConsolidator consolidator(bank, llm, observer);

                     auto result = consolidator.process_new_memory(new_memory("Likes tea"));
                     require(result.ok(), result.error());
                     require(std::holds_alternative<mem::AddAction>(result.value()), "add");
                     require(bank->size() == 1, "exactly one insert");
                     require(llm->prompts.empty(), "no LLM call without neighbours");
                     const auto stored = bank->get("new-1");
                     require(stored.has_value() && stored->raw_dialogue == "I said Likes tea",
                             "document fields carried");
                     require(observer->count<rmm::observability::ConsolidationEvent>() == 1,
                             "event recorded");
                   }});

  tests.push_back({"consolidation_merge_updates_neighbour", [] {
                     auto index = std::make_shared<rmm::testing::ScriptedIndex>();
                     index->matches = {neighbour("old-a", "Likes green tea"),
                                       neighbour("old-b", "Has a cat")};
                     auto llm = std::make_shared<rmm::testing::ScriptedLlm>();
                     llm->push_response("Merge(0, Likes green and black tea)");
                     mem::MemoryConsolidator consolidator(index, llm, nullptr, 3);

                     auto result = consolidator.process_new_memory(new_memory("Likes black tea"));
                     require(result.ok(), result.error());
                     require(std::holds_alternative<mem::MergeAction>(result.value()), "merge");
                     require(index->added.empty(), "merge does not insert");
                     require(index->updated.size() == 1, "one update");
                     const auto &doc = index->updated[0];
                     require(doc.id == "old-a", "target id kept");
                     require(doc.content == "Likes green and black tea", "summary replaced");
                     require(doc.session_id == "s1", "session kept");
                     require(doc.turn_references == std::vector<int>({0, 1}), "refs kept");
                     require(doc.timestamp > 100, "timestamp refreshed");
                     require(index->queries.size() == 1 && index->queries[0] == "Likes black tea",
                             "neighbours looked up by summary");
                     require(llm->prompts[0].find("Has a cat") != std::string::npos,
                             "history in prompt");
                   }});

  tests.push_back({"consolidation_applies_first_of_many_actions", [] {
                     auto index = std::make_shared<rmm::testing::ScriptedIndex>();
                     index->matches = {neighbour("old-a", "Likes tea")};
                     auto llm = std::make_shared<rmm::testing::ScriptedLlm>();
                     llm->push_response("Add()\nMerge(0, Likes tea a lot)");
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     mem::MemoryConsolidator consolidator(index, llm, observer);

                     auto result = consolidator.process_new_memory(new_memory("Drinks tea daily"));
                     require(result.ok(), result.error());
                     require(std::holds_alternative<mem::AddAction>(result.value()), "first wins");
                     require(index->added.size() == 1 && index->updated.empty(),
                             "only one action applied");
                     require(observer->count<rmm::observability::WarningEvent>() == 1,
                             "multiple actions warned");
                   }});

  tests.push_back({"consolidation_falls_back_to_add", [] {
                     auto index = std::make_shared<rmm::testing::ScriptedIndex>();
                     index->matches = {neighbour("old-a", "Likes tea")};
                     auto llm = std::make_shared<rmm::testing::ScriptedLlm>();
                     mem::MemoryConsolidator consolidator(index, llm);

                     llm->push_response("I am not sure what to do");
                     auto unparseable = consolidator.process_new_memory(new_memory("a"));
                     require(unparseable.ok() &&
                                 std::holds_alternative<mem::AddAction>(unparseable.value()),
                             "no actions means add");

                     llm->push_response("Merge(5, out of range)");
                     auto out_of_range = consolidator.process_new_memory(new_memory("b"));
                     require(out_of_range.ok() &&
                                 std::holds_alternative<mem::AddAction>(out_of_range.value()),
                             "bad index means add");

                     llm->set_failure("llm offline");
                     auto failed = consolidator.process_new_memory(new_memory("c"));
                     require(failed.ok() && std::holds_alternative<mem::AddAction>(failed.value()),
                             "LLM failure means add");
                     require(index->added.size() == 3 && index->updated.empty(), "three adds");
                   }});

  tests.push_back({"merge_without_usable_target_adds_instead", [] {
                     auto index = std::make_shared<rmm::testing::ScriptedIndex>();
                     index->matches.push_back(
                         mem::IndexMatch{.content = "likes tea", .metadata = {}, .score = 0.9});
                     auto llm = std::make_shared<rmm::testing::ScriptedLlm>();
                     llm->fallback = "Merge(0, Likes tea and coffee)";
                     auto observer = std::make_shared<rmm::testing::RecordingObserver>();
                     mem::MemoryConsolidator consolidator(index, llm, observer);

                     auto result = consolidator.process_new_memory(new_memory("Likes coffee"));
                     require(result.ok(), "neighbour without id does not fail capture");
                     require(std::holds_alternative<mem::AddAction>(result.value()),
                             "falls back to add");
                     require(index->updated.empty(), "no update against a made-up id");
                     require(index->added.size() == 1 && index->added[0].id == "new-1",
                             "new memory added");

                     index->matches = {neighbour("m7", "likes tea")};
                     index->fail_updates = true;
                     auto rejected = consolidator.process_new_memory(new_memory("Likes milk"));
                     require(rejected.ok() &&
                                 std::holds_alternative<mem::AddAction>(rejected.value()),
                             "rejected update falls back to add");
                     require(index->added.size() == 2, "second add");
                     require(observer->count<rmm::observability::WarningEvent>() == 2,
                             "each fallback warned");
                   }});

  tests.push_back({"consolidation_index_failures", [] {
                     auto index = std::make_shared<rmm::testing::ScriptedIndex>();
                     auto llm = std::make_shared<rmm::testing::ScriptedLlm>();
                     mem::MemoryConsolidator consolidator(index, llm);

                     index->mode = rmm::testing::IndexMode::Throw;
                     auto searched = consolidator.process_new_memory(new_memory("a"));
                     require(searched.ok() &&
                                 std::holds_alternative<mem::AddAction>(searched.value()),
                             "search failure treated as no neighbours");

                     index->mode = rmm::testing::IndexMode::ThrowValue;
                     auto odd_throw = consolidator.process_new_memory(new_memory("a2"));
                     require(odd_throw.ok() &&
                                 std::holds_alternative<mem::AddAction>(odd_throw.value()),
                             "non-standard throw treated as no neighbours");

                     index->mode = rmm::testing::IndexMode::Return;
                     index->fail_writes = true;
                     require(!consolidator.process_new_memory(new_memory("b")).ok(),
                             "write failure surfaces");

                     mem::MemoryConsolidator detached(nullptr, llm);
                     require(!detached.process_new_memory(new_memory("c")).ok(),
                             "missing index fails");
                   }});
}
