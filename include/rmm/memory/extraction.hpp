#pragma once

#include "rmm/common/result.hpp"
#include "rmm/memory/embedder.hpp"
#include "rmm/memory/types.hpp"
#include "rmm/observability/observer.hpp"
#include "rmm/providers/llm.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rmm::memory {

struct ExtractedSummary {
  std::string summary;
  std::vector<int> reference;
};

/// "* Turn N:" blocks, two messages per turn.
[[nodiscard]] std::string format_dialogue(const std::vector<StoredMessage> &messages);

/// NO_TRAIT yields an empty list. Markdown fences around the JSON are tolerated.
[[nodiscard]] common::Result<std::vector<ExtractedSummary>>
parse_extraction_output(const std::string &output);

/// Prospective reflection: turns a buffered session into new memory entries.
class MemoryExtractor {
public:
  MemoryExtractor(std::shared_ptr<providers::ILlmClient> llm, std::shared_ptr<IEmbedder> embedder,
                  std::shared_ptr<observability::IObserver> observer = nullptr);

  /// Fails when the LLM or embedder fails or the LLM output is unusable.
  [[nodiscard]] common::Result<std::vector<MemoryEntry>>
  extract(const std::vector<StoredMessage> &messages,
          const std::optional<std::string> &session_id = std::nullopt);

private:
  std::shared_ptr<providers::ILlmClient> llm_;
  std::shared_ptr<IEmbedder> embedder_;
  std::shared_ptr<observability::IObserver> observer_;
};

} // namespace rmm::memory
