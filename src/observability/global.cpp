#include "drover/observability/global.hpp"

#include <mutex>

namespace drover::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  // Hold a reference so a concurrent set_global_observer cannot free it mid-call.
  if (auto observer = current_observer()) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer()) {
    observer->record_metric(metric);
  }
}

void log_debug(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Debug, .component = component, .message = message});
}

void log_info(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Info, .component = component, .message = message});
}

void log_warn(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Warn, .component = component, .message = message});
}

void record_agent_start(const std::string &agent_id, const std::string &model) {
  record_event(AgentStartEvent{.agent_id = agent_id, .model = model});
}

void record_agent_end(AgentEndEvent event) { record_event(std::move(event)); }

void record_turn_complete(const std::string &agent_id, const std::uint64_t turn,
                          const std::uint32_t attempts, std::optional<std::uint64_t> tokens) {
  record_event(TurnCompleteEvent{
      .agent_id = agent_id, .turn = turn, .attempts = attempts, .tokens_used = tokens});
  if (tokens.has_value()) {
    record_metric(TokensUsedMetric{.tokens = *tokens});
  }
}

void record_tool_call(const std::string &tool, const std::string &call_id,
                      const std::string &outcome, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool,
                             .call_id = call_id,
                             .outcome = outcome,
                             .duration = duration,
                             .success = success});
}

void record_compression(const std::uint64_t original_tokens, const std::uint64_t summary_tokens,
                        const bool succeeded) {
  record_event(CompressionEvent{.original_tokens = original_tokens,
                                .summary_tokens = summary_tokens,
                                .succeeded = succeeded});
}

void record_prune(const std::uint64_t original_tokens, const std::uint64_t retained_tokens,
                  const std::uint32_t reduction_percent) {
  record_event(PruneEvent{.original_tokens = original_tokens,
                          .retained_tokens = retained_tokens,
                          .reduction_percent = reduction_percent});
  record_metric(ContextTokensMetric{.tokens = retained_tokens});
}

void record_loop_detected(const std::string &kind, const std::string &detail) {
  record_event(LoopDetectedEvent{.kind = kind, .detail = detail});
}

void record_time_warning(const std::string &agent_id, const std::chrono::milliseconds elapsed,
                         const std::chrono::milliseconds budget) {
  record_event(TimeWarningEvent{.agent_id = agent_id, .elapsed = elapsed, .budget = budget});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace drover::observability
