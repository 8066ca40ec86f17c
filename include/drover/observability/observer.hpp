#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace drover::observability {

enum class LogLevel { Debug, Info, Warn, Error };

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct AgentStartEvent {
  std::string agent_id;
  std::string model;
};

struct AgentEndEvent {
  std::string agent_id;
  std::string termination;
  std::string reason;
  std::uint64_t turns = 0;
  std::uint64_t tool_calls = 0;
  std::chrono::milliseconds duration{0};
};

struct TurnCompleteEvent {
  std::string agent_id;
  std::uint64_t turn = 0;
  std::uint32_t attempts = 1;
  std::optional<std::uint64_t> tokens_used;
};

struct ToolCallEvent {
  std::string tool;
  std::string call_id;
  std::string outcome;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct CompressionEvent {
  std::uint64_t original_tokens = 0;
  std::uint64_t summary_tokens = 0;
  bool succeeded = false;
};

struct PruneEvent {
  std::uint64_t original_tokens = 0;
  std::uint64_t retained_tokens = 0;
  std::uint32_t reduction_percent = 0;
};

struct LoopDetectedEvent {
  std::string kind;
  std::string detail;
};

struct TimeWarningEvent {
  std::string agent_id;
  std::chrono::milliseconds elapsed{0};
  std::chrono::milliseconds budget{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<LogEvent, AgentStartEvent, AgentEndEvent, TurnCompleteEvent, ToolCallEvent,
                 CompressionEvent, PruneEvent, LoopDetectedEvent, TimeWarningEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct ContextTokensMetric {
  std::uint64_t tokens = 0;
};

using ObserverMetric =
    std::variant<RequestLatencyMetric, TokensUsedMetric, QueueDepthMetric, ContextTokensMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string_view log_level_name(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view value);

} // namespace drover::observability
