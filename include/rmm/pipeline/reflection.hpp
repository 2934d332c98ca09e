#pragma once

#include "rmm/config/schema.hpp"
#include "rmm/memory/consolidation.hpp"
#include "rmm/memory/extraction.hpp"
#include "rmm/observability/observer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rmm::pipeline {

/// Max thresholds force reflection. Otherwise "strict" needs both minimums
/// and "relaxed" either one.
[[nodiscard]] bool should_reflect(std::size_t human_message_count,
                                  std::int64_t ms_since_last_update,
                                  const config::ReflectionConfig &config);

struct ReflectionReport {
  std::size_t extracted = 0;
  std::size_t added = 0;
  std::size_t merged = 0;
};

/// Prospective reflection over one buffered session.
class ProspectiveReflection {
public:
  ProspectiveReflection(std::shared_ptr<memory::MemoryExtractor> extractor,
                        std::shared_ptr<memory::MemoryConsolidator> consolidator,
                        std::shared_ptr<observability::IObserver> observer = nullptr);

  /// Extract memories and consolidate each. Fails on extraction failure or
  /// when the memory bank rejects a write.
  [[nodiscard]] common::Result<ReflectionReport>
  reflect(const std::string &user_id, const std::vector<memory::StoredMessage> &messages,
          const std::optional<std::string> &session_id = std::nullopt);

private:
  std::shared_ptr<memory::MemoryExtractor> extractor_;
  std::shared_ptr<memory::MemoryConsolidator> consolidator_;
  std::shared_ptr<observability::IObserver> observer_;
};

} // namespace rmm::pipeline
