#include "drover/observability/factory.hpp"

#include "drover/common/fs.hpp"
#include "drover/observability/log_observer.hpp"
#include "drover/observability/multi_observer.hpp"
#include "drover/observability/noop_observer.hpp"

#include <sstream>

namespace drover::observability {

namespace {

std::unique_ptr<IObserver> make_single(const std::string &backend, const LogLevel level) {
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.level).value_or(LogLevel::Info);
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    if (auto single = make_single(backend, level)) {
      return single;
    }
    return std::make_unique<LogObserver>(level);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi->add(make_single(common::trim(part), level));
  }
  return multi;
}

} // namespace drover::observability
