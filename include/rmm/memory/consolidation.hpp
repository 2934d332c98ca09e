#pragma once

#include "rmm/memory/candidate_index.hpp"
#include "rmm/memory/retrieval.hpp"
#include "rmm/observability/observer.hpp"
#include "rmm/providers/llm.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rmm::memory {

/// Parse LLM output lines into actions. Lines other than "Add()" or
/// "Merge(index, summary)" with index < history_length are dropped.
[[nodiscard]] std::vector<UpdateAction> parse_update_actions(const std::string &output,
                                                             std::size_t history_length);

/// Decides Add vs Merge for freshly extracted memories and applies the decision.
class MemoryConsolidator {
public:
  MemoryConsolidator(std::shared_ptr<ICandidateIndex> index,
                     std::shared_ptr<providers::ILlmClient> llm,
                     std::shared_ptr<observability::IObserver> observer = nullptr,
                     std::size_t similar_k = 5);

  /// Exactly one action is applied per call. A merge that cannot be applied
  /// becomes an add. Fails only when the index rejects the add.
  [[nodiscard]] common::Result<UpdateAction> process_new_memory(const MemoryEntry &memory);

  /// Actions suggested by the LLM; empty when the call fails.
  [[nodiscard]] std::vector<UpdateAction> decide(const MemoryEntry &memory,
                                                 const std::vector<RetrievedMemory> &similar);

private:
  common::Status add(const MemoryEntry &memory);
  common::Status merge(const RetrievedMemory &target, const std::string &merged_summary);
  void warn(std::string message);

  std::shared_ptr<ICandidateIndex> index_;
  std::shared_ptr<providers::ILlmClient> llm_;
  std::shared_ptr<observability::IObserver> observer_;
  CandidateRetrieval retrieval_;
  std::size_t similar_k_;
};

} // namespace rmm::memory
