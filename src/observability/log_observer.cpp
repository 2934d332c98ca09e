#include "rmm/observability/log_observer.hpp"

#include "rmm/common/fs.hpp"

#include <type_traits>

namespace rmm::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RetrievalFallbackEvent>) {
          log_line(LogLevel::Warn, evt.component + ": falling back (" + evt.reason + ")");
        } else if constexpr (std::is_same_v<T, SelectionEvent>) {
          log_line(LogLevel::Debug, "reranker.select user=" + evt.user_id +
                                        " candidates=" + std::to_string(evt.candidates) +
                                        " selected=" + std::to_string(evt.selected));
        } else if constexpr (std::is_same_v<T, WeightUpdateEvent>) {
          log_line(LogLevel::Info, "reranker.update user=" + evt.user_id +
                                       " shown=" + std::to_string(evt.shown) +
                                       " cited=" + std::to_string(evt.cited) +
                                       " persisted=" + (evt.persisted ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, ConsolidationEvent>) {
          std::string line = "consolidation." + evt.action + " memory=" + evt.memory_id;
          if (evt.merge_index.has_value()) {
            line += " index=" + std::to_string(*evt.merge_index);
          }
          log_line(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, ReflectionEvent>) {
          log_line(LogLevel::Info, "reflection." + evt.stage + " user=" + evt.user_id +
                                       (evt.detail.empty() ? "" : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, PersistenceFailureEvent>) {
          log_line(LogLevel::Warn, "persistence." + evt.operation + " user=" + evt.user_id +
                                       " failed: " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, StageLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.latency_ms stage=" + m.stage + " value=" +
                       std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CitationRateMetric>) {
          log_line(LogLevel::Debug, "metric.citations cited=" + std::to_string(m.cited) +
                                        " shown=" + std::to_string(m.shown));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace rmm::observability
