#include "rmm/memory/consolidation.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/id.hpp"
#include "rmm/memory/prompts.hpp"
#include "rmm/observability/factory.hpp"

#include <exception>
#include <regex>
#include <sstream>

namespace rmm::memory {

namespace {

const std::regex &merge_pattern() {
  static const std::regex pattern(R"(^Merge\((\d+),\s*(.+)\)$)");
  return pattern;
}

} // namespace

std::vector<UpdateAction> parse_update_actions(const std::string &output,
                                               const std::size_t history_length) {
  std::vector<UpdateAction> actions;
  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    const std::string trimmed = common::trim(line);
    if (trimmed == "Add()") {
      actions.emplace_back(AddAction{});
      continue;
    }
    if (!common::starts_with(trimmed, "Merge(")) {
      continue;
    }

    std::smatch match;
    if (!std::regex_match(trimmed, match, merge_pattern())) {
      continue;
    }
    const std::string digits = match[1].str();
    if (digits.size() > 9) {
      continue;
    }
    const auto index = static_cast<std::size_t>(std::stoul(digits));
    const std::string summary = common::trim(match[2].str());
    if (index >= history_length || summary.empty()) {
      continue;
    }
    actions.emplace_back(MergeAction{.index = index, .merged_summary = summary});
  }
  return actions;
}

MemoryConsolidator::MemoryConsolidator(std::shared_ptr<ICandidateIndex> index,
                                       std::shared_ptr<providers::ILlmClient> llm,
                                       std::shared_ptr<observability::IObserver> observer,
                                       const std::size_t similar_k)
    : index_(std::move(index)), llm_(std::move(llm)),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()),
      retrieval_(index_, observer_), similar_k_(similar_k) {}

void MemoryConsolidator::warn(std::string message) {
  observer_->record_event(
      observability::WarningEvent{.component = "consolidation", .message = std::move(message)});
}

std::vector<UpdateAction> MemoryConsolidator::decide(const MemoryEntry &memory,
                                                     const std::vector<RetrievedMemory> &similar) {
  if (llm_ == nullptr) {
    return {};
  }

  std::vector<std::string> history;
  history.reserve(similar.size());
  for (const auto &entry : similar) {
    history.push_back(entry.memory.topic_summary);
  }

  common::Result<std::string> response = common::Result<std::string>::failure("not called");
  try {
    response = llm_->generate(update_memory_prompt(history, memory.topic_summary));
  } catch (const std::exception &ex) {
    warn(std::string("update decision threw: ") + ex.what());
    return {};
  } catch (...) {
    warn("update decision threw a non-standard exception");
    return {};
  }
  if (!response.ok()) {
    warn("update decision failed: " + response.error());
    return {};
  }
  return parse_update_actions(response.value(), history.size());
}

common::Status MemoryConsolidator::add(const MemoryEntry &memory) {
  try {
    return index_->add(to_index_document(memory));
  } catch (const std::exception &ex) {
    return common::Status::error(std::string("index add threw: ") + ex.what());
  } catch (...) {
    return common::Status::error("index add threw a non-standard exception");
  }
}

common::Status MemoryConsolidator::merge(const RetrievedMemory &target,
                                         const std::string &merged_summary) {
  IndexDocument document = to_index_document(target.memory);
  document.content = merged_summary;
  document.timestamp = common::now_ms();
  try {
    return index_->update(document);
  } catch (const std::exception &ex) {
    return common::Status::error(std::string("index update threw: ") + ex.what());
  } catch (...) {
    return common::Status::error("index update threw a non-standard exception");
  }
}

common::Result<UpdateAction> MemoryConsolidator::process_new_memory(const MemoryEntry &memory) {
  using ResultT = common::Result<UpdateAction>;
  if (index_ == nullptr) {
    return ResultT::failure("no candidate index configured");
  }

  const auto similar = retrieval_.retrieve_similar(memory, similar_k_);

  UpdateAction chosen = AddAction{};
  if (!similar.empty()) {
    const auto actions = decide(memory, similar);
    if (actions.size() > 1) {
      warn("update decision returned " + std::to_string(actions.size()) +
           " actions; applying the first");
    }
    if (!actions.empty()) {
      chosen = actions.front();
    }
  }

  if (const auto *merge_action = std::get_if<MergeAction>(&chosen)) {
    const std::size_t target = merge_action->index;
    if (target >= similar.size()) {
      warn("merge index " + std::to_string(target) + " out of range; adding instead");
    } else if (!similar[target].has_index_id) {
      warn("merge target " + std::to_string(target) + " has no stored id; adding instead");
    } else if (const auto status = merge(similar[target], merge_action->merged_summary);
               !status.ok()) {
      warn("merge into " + similar[target].memory.id + " failed: " + status.error() +
           "; adding instead");
    } else {
      observer_->record_event(observability::ConsolidationEvent{
          .memory_id = similar[target].memory.id,
          .action = "merge",
          .merge_index = target,
      });
      return ResultT::success(chosen);
    }
    chosen = AddAction{};
  }

  const auto status = add(memory);
  if (!status.ok()) {
    return ResultT::failure(status.error());
  }
  observer_->record_event(observability::ConsolidationEvent{
      .memory_id = memory.id, .action = "add", .merge_index = std::nullopt});
  return ResultT::success(chosen);
}

} // namespace rmm::memory
