#include "rmm/memory/types.hpp"

#include "rmm/memory/candidate_index.hpp"

#include <algorithm>

namespace rmm::memory {

std::size_t count_human_messages(const std::vector<StoredMessage> &messages) {
  return static_cast<std::size_t>(
      std::count_if(messages.begin(), messages.end(),
                    [](const StoredMessage &message) { return message.type == "human"; }));
}

IndexDocument to_index_document(const MemoryEntry &entry) {
  return IndexDocument{.id = entry.id,
                       .content = entry.topic_summary,
                       .session_id = entry.session_id,
                       .timestamp = entry.timestamp,
                       .turn_references = entry.turn_references,
                       .raw_dialogue = entry.raw_dialogue};
}

} // namespace rmm::memory
