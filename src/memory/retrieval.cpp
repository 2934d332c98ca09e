#include "rmm/memory/retrieval.hpp"

#include "rmm/common/id.hpp"
#include "rmm/observability/factory.hpp"

#include <exception>

namespace rmm::memory {

RetrievedMemory to_retrieved_memory(const IndexMatch &match, const std::int64_t now,
                                    const std::size_t position) {
  const auto &metadata = match.metadata;
  MemoryEntry entry{
      .id = metadata.id.value_or("memory-" + std::to_string(position)),
      .topic_summary = match.content,
      .raw_dialogue = metadata.raw_dialogue.value_or(""),
      .timestamp = metadata.timestamp.value_or(now),
      .session_id = metadata.session_id.value_or("unknown"),
      .embedding = {},
      .turn_references = metadata.turn_references.value_or(std::vector<int>{}),
  };
  return RetrievedMemory{.memory = std::move(entry),
                         .relevance_score = match.score.value_or(-1.0),
                         .has_index_id = metadata.id.has_value()};
}

CandidateRetrieval::CandidateRetrieval(std::shared_ptr<ICandidateIndex> index,
                                       std::shared_ptr<observability::IObserver> observer)
    : index_(std::move(index)),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()) {}

common::Result<std::vector<RetrievedMemory>>
CandidateRetrieval::try_search(const std::string &query, const std::size_t k) const {
  using ResultT = common::Result<std::vector<RetrievedMemory>>;
  if (index_ == nullptr) {
    return ResultT::failure("no candidate index configured");
  }
  if (k == 0) {
    return ResultT::success({});
  }

  common::Result<std::vector<IndexMatch>> matches =
      common::Result<std::vector<IndexMatch>>::failure("search not attempted");
  try {
    matches = index_->search(query, k);
  } catch (const std::exception &ex) {
    return ResultT::failure(std::string("index threw: ") + ex.what());
  } catch (...) {
    return ResultT::failure("index threw a non-standard exception");
  }
  if (!matches.ok()) {
    return ResultT::failure(matches.error());
  }

  const std::int64_t now = common::now_ms();
  std::vector<RetrievedMemory> out;
  out.reserve(matches.value().size());
  for (const auto &match : matches.value()) {
    out.push_back(to_retrieved_memory(match, now, out.size()));
  }
  return ResultT::success(std::move(out));
}

std::vector<RetrievedMemory> CandidateRetrieval::search(const std::string &query,
                                                        const std::size_t k) const {
  auto result = try_search(query, k);
  if (!result.ok()) {
    observer_->record_event(
        observability::RetrievalFallbackEvent{.component = "retrieval", .reason = result.error()});
    return {};
  }
  return std::move(result.value());
}

std::vector<RetrievedMemory> CandidateRetrieval::retrieve_similar(const MemoryEntry &memory,
                                                                  const std::size_t k) const {
  return search(memory.topic_summary, k);
}

} // namespace rmm::memory
