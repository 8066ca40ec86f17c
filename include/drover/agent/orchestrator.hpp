#pragma once

#include "drover/agent/agent_registry.hpp"
#include "drover/agent/deadline_timer.hpp"
#include "drover/agent/loop_detector.hpp"
#include "drover/agent/turn_engine.hpp"
#include "drover/bus/message_bus.hpp"
#include "drover/common/cancellation.hpp"
#include "drover/config/schema.hpp"
#include "drover/context/context_manager.hpp"
#include "drover/scheduler/executor.hpp"
#include "drover/scheduler/tool_call.hpp"
#include "drover/security/policy.hpp"
#include "drover/tools/tool_registry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drover::agent {

enum class TerminationMode { Goal, Timeout, MaxTurns, Aborted, Error, CycleDetected };

[[nodiscard]] std::string_view termination_mode_name(TerminationMode mode);

/// Per-run record handed to the completion hook.
struct RunSummary {
  std::string agent_id;
  TerminationMode mode = TerminationMode::Goal;
  std::uint64_t turns = 0;
  std::uint64_t tool_calls = 0;
  std::uint64_t duration_ms = 0;
};

struct RunResult {
  TerminationMode mode = TerminationMode::Goal;
  /// Why the run stopped; empty on a plain GOAL.
  std::string reason;
  /// complete_task's result, or the final model text of an interactive turn.
  std::string output;
  RunSummary summary;
};

enum class ActivityKind {
  TurnStarted,
  Delta,
  ToolCallRequested,
  ToolCallFinished,
  Compressed,
  Pruned,
  TimeWarning,
  LoopDetected,
  Recovery,
  Error,
};

[[nodiscard]] std::string_view activity_kind_name(ActivityKind kind);

struct ActivityEvent {
  ActivityKind kind = ActivityKind::Delta;
  std::string text;
  std::string tool_name;
  std::string call_id;
  std::uint64_t turn = 0;
};

struct RunOptions {
  /// Interactive runs end when the model answers without tools; autonomous runs must
  /// call complete_task.
  bool interactive = false;
  common::CancellationToken cancel;
  std::function<void(const ActivityEvent &)> on_activity;
  std::function<void(const RunSummary &)> on_complete;
};

/// External collaborators of a run. All of them must outlive the orchestrator.
struct OrchestratorDeps {
  providers::ContentGenerator &generator;
  const tools::ToolRegistry &registry;
  security::IPolicyDecisionProvider &policy;
  scheduler::IToolExecutor &executor;
  bus::MessageBus &bus;
  context::EmbeddingCache *embedding_cache = nullptr;
};

/// Runs one agent as a bounded loop of model turns and tool batches. The session's
/// history survives across run() calls, so an interactive driver can call run() once
/// per user prompt. run() must not be called concurrently.
class AgentRunOrchestrator {
public:
  AgentRunOrchestrator(OrchestratorDeps deps, AgentDefinition definition, config::Config config,
                       std::filesystem::path workspace);

  AgentRunOrchestrator(const AgentRunOrchestrator &) = delete;
  AgentRunOrchestrator &operator=(const AgentRunOrchestrator &) = delete;

  RunResult run(const std::string &prompt, const RunOptions &options = {});

  [[nodiscard]] const std::string &agent_id() const { return agent_id_; }
  [[nodiscard]] const AgentDefinition &definition() const { return definition_; }
  [[nodiscard]] TurnEngine &turn_engine() { return *turn_engine_; }
  [[nodiscard]] context::ContextManager &context_manager() { return *context_; }
  [[nodiscard]] const tools::ToolRegistry &tools() const { return tools_; }

private:
  struct RunState;

  void emit(const RunState &state, ActivityEvent event) const;
  void check_time_warning(RunState &state) const;
  void prune_history(RunState &state);
  [[nodiscard]] TurnOutcome model_turn(RunState &state,
                                       std::vector<providers::Message> content,
                                       const common::CancellationToken &cancel,
                                       bool track_content);
  [[nodiscard]] std::vector<scheduler::ToolCall>
  execute_calls(RunState &state, const std::vector<providers::FunctionCall> &calls);
  /// Final warning turn. Returns complete_task's result when the model recovers.
  [[nodiscard]] std::optional<std::string> attempt_recovery(RunState &state,
                                                            TerminationMode reason,
                                                            std::vector<providers::Message> pending);
  /// Leaves history ending in answered calls: records unsent tool responses and answers
  /// any call the run stopped before executing.
  void close_open_turn(const std::vector<providers::Message> &pending);
  [[nodiscard]] std::string failure_reason(TerminationMode mode) const;

  OrchestratorDeps deps_;
  AgentDefinition definition_;
  config::Config config_;
  std::filesystem::path workspace_;
  std::string agent_id_;
  tools::ToolRegistry tools_;
  std::unique_ptr<context::ContextManager> context_;
  std::unique_ptr<TurnEngine> turn_engine_;
  LoopDetector loop_detector_;
  std::uint64_t run_count_ = 0;
};

/// Final-warning message sent in the recovery turn.
[[nodiscard]] std::string final_warning_message(TerminationMode reason);

} // namespace drover::agent
