#pragma once

#include "rmm/memory/candidate_index.hpp"
#include "rmm/observability/observer.hpp"

#include <memory>

namespace rmm::memory {

/// Wraps the candidate index; failures of the index never reach callers.
class CandidateRetrieval {
public:
  explicit CandidateRetrieval(std::shared_ptr<ICandidateIndex> index,
                              std::shared_ptr<observability::IObserver> observer = nullptr);

  /// Neighbours of `memory` by topic summary; empty on any index failure.
  [[nodiscard]] std::vector<RetrievedMemory> retrieve_similar(const MemoryEntry &memory,
                                                              std::size_t k = 5) const;

  /// Top-k memories for free text; empty on any index failure.
  [[nodiscard]] std::vector<RetrievedMemory> search(const std::string &query,
                                                    std::size_t k) const;

  /// Same lookup with the failure reported instead of logged.
  [[nodiscard]] common::Result<std::vector<RetrievedMemory>> try_search(const std::string &query,
                                                                        std::size_t k) const;

private:
  std::shared_ptr<ICandidateIndex> index_;
  std::shared_ptr<observability::IObserver> observer_;
};

/// Missing metadata gets conservative defaults: timestamp `now`, no turn
/// references, session "unknown", id "memory-<position>".
[[nodiscard]] RetrievedMemory to_retrieved_memory(const IndexMatch &match, std::int64_t now,
                                                  std::size_t position);

} // namespace rmm::memory
