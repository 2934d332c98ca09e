#include "rmm/pipeline/reflection.hpp"

#include "rmm/observability/factory.hpp"

namespace rmm::pipeline {

bool should_reflect(const std::size_t human_message_count, const std::int64_t ms_since_last_update,
                    const config::ReflectionConfig &config) {
  if (human_message_count >= config.max_turns) {
    return true;
  }
  if (ms_since_last_update >= config.max_inactivity_ms) {
    return true;
  }

  const bool min_turns_met = human_message_count >= config.min_turns;
  const bool min_inactivity_met = ms_since_last_update >= config.min_inactivity_ms;
  if (config.mode == "strict") {
    return min_turns_met && min_inactivity_met;
  }
  return min_turns_met || min_inactivity_met;
}

ProspectiveReflection::ProspectiveReflection(
    std::shared_ptr<memory::MemoryExtractor> extractor,
    std::shared_ptr<memory::MemoryConsolidator> consolidator,
    std::shared_ptr<observability::IObserver> observer)
    : extractor_(std::move(extractor)), consolidator_(std::move(consolidator)),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()) {}

common::Result<ReflectionReport>
ProspectiveReflection::reflect(const std::string &user_id,
                               const std::vector<memory::StoredMessage> &messages,
                               const std::optional<std::string> &session_id) {
  using ResultT = common::Result<ReflectionReport>;
  if (extractor_ == nullptr || consolidator_ == nullptr) {
    return ResultT::failure("reflection is not configured");
  }

  auto memories = extractor_->extract(messages, session_id);
  if (!memories.ok()) {
    return ResultT::failure(memories.error());
  }

  ReflectionReport report{.extracted = memories.value().size()};
  observer_->record_event(observability::ReflectionEvent{
      .user_id = user_id,
      .stage = "extracted",
      .detail = std::to_string(report.extracted) + " memories"});

  for (const auto &entry : memories.value()) {
    auto action = consolidator_->process_new_memory(entry);
    if (!action.ok()) {
      return ResultT::failure("consolidating " + entry.id + " failed: " + action.error());
    }
    if (std::holds_alternative<memory::MergeAction>(action.value())) {
      ++report.merged;
    } else {
      ++report.added;
    }
  }
  return ResultT::success(report);
}

} // namespace rmm::pipeline
