#include "drover/observability/log_observer.hpp"

#include "drover/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace drover::observability {

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

std::optional<LogLevel> parse_log_level(std::string_view value) {
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

LogObserver::LogObserver(const LogLevel min_level, std::ostream *out)
    : min_level_(min_level), out_(out != nullptr ? out : &std::cerr) {}

void LogObserver::write(const LogLevel level, const std::string &message) {
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
        if constexpr (std::is_same_v<T, LogEvent>) {
          write(evt.level, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, AgentStartEvent>) {
          write(LogLevel::Info, "agent.start id=" + evt.agent_id + " model=" + evt.model);
        } else if constexpr (std::is_same_v<T, AgentEndEvent>) {
          write(LogLevel::Info, "agent.end id=" + evt.agent_id + " mode=" + evt.termination +
                                    " turns=" + std::to_string(evt.turns) +
                                    " tool_calls=" + std::to_string(evt.tool_calls) +
                                    " duration_ms=" + std::to_string(evt.duration.count()) +
                                    (evt.reason.empty() ? "" : " reason=\"" + evt.reason + "\""));
        } else if constexpr (std::is_same_v<T, TurnCompleteEvent>) {
          write(LogLevel::Debug, "turn.complete id=" + evt.agent_id +
                                     " turn=" + std::to_string(evt.turn) +
                                     " attempts=" + std::to_string(evt.attempts));
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          write(evt.success ? LogLevel::Info : LogLevel::Warn,
                "tool.call name=" + evt.tool + " id=" + evt.call_id + " outcome=" + evt.outcome +
                    " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, CompressionEvent>) {
          write(evt.succeeded ? LogLevel::Info : LogLevel::Warn,
                "context.compress original_tokens=" + std::to_string(evt.original_tokens) +
                    " summary_tokens=" + std::to_string(evt.summary_tokens) +
                    (evt.succeeded ? " ok" : " rejected"));
        } else if constexpr (std::is_same_v<T, PruneEvent>) {
          write(LogLevel::Debug, "context.prune original_tokens=" +
                                     std::to_string(evt.original_tokens) +
                                     " retained_tokens=" + std::to_string(evt.retained_tokens) +
                                     " reduction=" + std::to_string(evt.reduction_percent) + "%");
        } else if constexpr (std::is_same_v<T, LoopDetectedEvent>) {
          write(LogLevel::Warn, "loop.detected kind=" + evt.kind + " " + evt.detail);
        } else if constexpr (std::is_same_v<T, TimeWarningEvent>) {
          write(LogLevel::Warn, "agent.time_warning id=" + evt.agent_id +
                                    " elapsed_ms=" + std::to_string(evt.elapsed.count()) +
                                    " budget_ms=" + std::to_string(evt.budget.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          write(LogLevel::Debug, "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          write(LogLevel::Debug, "metric.tokens_used=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          write(LogLevel::Debug, "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, ContextTokensMetric>) {
          write(LogLevel::Debug, "metric.context_tokens=" + std::to_string(m.tokens));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace drover::observability
