#pragma once

#include "drover/observability/observer.hpp"

#include <memory>

namespace drover::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);

void record_agent_start(const std::string &agent_id, const std::string &model);
void record_agent_end(AgentEndEvent event);
void record_turn_complete(const std::string &agent_id, std::uint64_t turn, std::uint32_t attempts,
                          std::optional<std::uint64_t> tokens = std::nullopt);
void record_tool_call(const std::string &tool, const std::string &call_id,
                      const std::string &outcome, std::chrono::milliseconds duration,
                      bool success);
void record_compression(std::uint64_t original_tokens, std::uint64_t summary_tokens,
                        bool succeeded);
void record_prune(std::uint64_t original_tokens, std::uint64_t retained_tokens,
                  std::uint32_t reduction_percent);
void record_loop_detected(const std::string &kind, const std::string &detail);
void record_time_warning(const std::string &agent_id, std::chrono::milliseconds elapsed,
                         std::chrono::milliseconds budget);
void record_error(const std::string &component, const std::string &message);

} // namespace drover::observability
