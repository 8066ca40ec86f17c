#pragma once

#include "drover/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace drover::observability {

/// Writes `[LEVEL] message` lines, dropping anything below `min_level`.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream *out = nullptr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace drover::observability
