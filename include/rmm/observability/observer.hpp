#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rmm::observability {

struct RetrievalFallbackEvent {
  std::string component;
  std::string reason;
};

struct SelectionEvent {
  std::string user_id;
  std::size_t candidates = 0;
  std::size_t selected = 0;
};

struct WeightUpdateEvent {
  std::string user_id;
  std::size_t shown = 0;
  std::size_t cited = 0;
  bool persisted = false;
};

struct ConsolidationEvent {
  std::string memory_id;
  std::string action; // "add" or "merge"
  std::optional<std::size_t> merge_index;
};

struct ReflectionEvent {
  std::string user_id;
  std::string stage;
  std::string detail;
};

struct PersistenceFailureEvent {
  std::string operation;
  std::string user_id;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RetrievalFallbackEvent, SelectionEvent, WeightUpdateEvent, ConsolidationEvent,
                 ReflectionEvent, PersistenceFailureEvent, WarningEvent, ErrorEvent>;

struct StageLatencyMetric {
  std::string stage;
  std::chrono::milliseconds latency{0};
};

struct CitationRateMetric {
  std::size_t cited = 0;
  std::size_t shown = 0;
};

using ObserverMetric = std::variant<StageLatencyMetric, CitationRateMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rmm::observability
