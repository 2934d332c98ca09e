#include "rmm/observability/factory.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/observability/log_observer.hpp"
#include "rmm/observability/multi_observer.hpp"
#include "rmm/observability/noop_observer.hpp"

namespace rmm::observability {

namespace {

std::shared_ptr<IObserver> make_single(const std::string &backend, const LogLevel level) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_shared<NoopObserver>();
  }
  return std::make_shared<LogObserver>(level);
}

} // namespace

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level = parse_log_level(config.observability.log_level).value_or(LogLevel::Info);
  const std::string backend = common::to_lower(common::trim(config.observability.backend));

  if (backend.find(',') == std::string::npos) {
    return make_single(backend, level);
  }

  auto multi = std::make_shared<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    const std::string name = common::trim(part);
    if (name == "log" || name == "noop" || name == "none") {
      multi->add(make_single(name, level));
    }
  }
  return multi;
}

std::shared_ptr<IObserver> noop_observer() {
  static const auto instance = std::make_shared<NoopObserver>();
  return instance;
}

} // namespace rmm::observability
