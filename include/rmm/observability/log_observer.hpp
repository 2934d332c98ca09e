#pragma once

#include "rmm/observability/observer.hpp"

#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace rmm::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

/// Writes "[LEVEL] message" lines; lines below the instance level are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream &out = std::cerr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] LogLevel level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace rmm::observability
