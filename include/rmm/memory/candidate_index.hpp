#pragma once

#include "rmm/common/result.hpp"
#include "rmm/memory/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rmm::memory {

/// Metadata attached to an index match; any field may be missing.
struct IndexMetadata {
  std::optional<std::string> id;
  std::optional<std::string> session_id;
  std::optional<std::vector<int>> turn_references;
  std::optional<std::int64_t> timestamp;
  std::optional<std::string> raw_dialogue;
};

struct IndexMatch {
  std::string content;
  IndexMetadata metadata;
  std::optional<double> score;
};

/// Document written to the memory bank; content is the topic summary.
struct IndexDocument {
  std::string id;
  std::string content;
  std::string session_id;
  std::int64_t timestamp = 0;
  std::vector<int> turn_references;
  std::string raw_dialogue;
};

/// External similarity index over the memory bank.
class ICandidateIndex {
public:
  virtual ~ICandidateIndex() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Ranked matches, most similar first.
  [[nodiscard]] virtual common::Result<std::vector<IndexMatch>> search(const std::string &query,
                                                                       std::size_t k) = 0;
  [[nodiscard]] virtual common::Status add(const IndexDocument &document) = 0;
  /// Replace the document with the same id; fails when no such document exists.
  [[nodiscard]] virtual common::Status update(const IndexDocument &document) = 0;
};

[[nodiscard]] IndexDocument to_index_document(const MemoryEntry &entry);

} // namespace rmm::memory
