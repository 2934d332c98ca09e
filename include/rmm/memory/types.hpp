#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rmm::memory {

/// Consolidated unit of remembered information owned by the memory bank.
struct MemoryEntry {
  std::string id;
  std::string topic_summary;
  std::string raw_dialogue;
  std::int64_t timestamp = 0;
  std::string session_id;
  std::vector<double> embedding;
  std::vector<int> turn_references;
};

/// MemoryEntry plus the index's similarity score (-1 when the index gave none).
struct RetrievedMemory {
  MemoryEntry memory;
  double relevance_score = -1.0;
  /// False when the index returned no id and a positional one was filled in.
  bool has_index_id = true;
};

struct AddAction {};

struct MergeAction {
  std::size_t index = 0;
  std::string merged_summary;
};

using UpdateAction = std::variant<AddAction, MergeAction>;

/// One conversation message as persisted in a message buffer.
/// type is "human", "ai", "system" or "tool".
struct StoredMessage {
  std::string type;
  std::string content;

  bool operator==(const StoredMessage &) const = default;
};

[[nodiscard]] std::size_t count_human_messages(const std::vector<StoredMessage> &messages);

} // namespace rmm::memory
