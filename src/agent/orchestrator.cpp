#include "drover/agent/orchestrator.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/hash.hpp"
#include "drover/observability/global.hpp"
#include "drover/scheduler/tool_scheduler.hpp"
#include "drover/tools/builtin/complete_task.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace drover::agent {

namespace {

constexpr std::string_view kComponent = "agent";
constexpr std::string_view kNoCompletionReason =
    "Agent stopped calling tools without calling complete_task";

bool is_complete_task(const providers::FunctionCall &call) {
  return common::to_lower(common::trim(call.name)) == tools::kCompleteTaskToolName;
}

providers::Message response_message(const providers::FunctionCall &call, std::string output,
                                    const bool is_error) {
  return providers::Message::tool(providers::FunctionResponse{
      .call_id = call.id, .name = call.name, .output = std::move(output), .is_error = is_error});
}

/// complete_task's "result" argument, when present and non-empty.
std::optional<std::string> completion_result(const providers::FunctionCall &call) {
  auto args = tools::parse_tool_args(call.args_json);
  if (!args.ok()) {
    return std::nullopt;
  }
  auto result = tools::arg_string(args.value(), "result");
  if (!result.has_value() || common::trim(*result).empty()) {
    return std::nullopt;
  }
  return result;
}

std::string format_minutes(const std::chrono::milliseconds budget) {
  std::ostringstream out;
  out << static_cast<double>(budget.count()) / 60000.0;
  return out.str();
}

bool reached_execution(const scheduler::ToolCall &call) {
  const auto &history = call.history();
  return std::find(history.begin(), history.end(), scheduler::ToolCallState::Executing) !=
         history.end();
}

} // namespace

std::string_view termination_mode_name(const TerminationMode mode) {
  switch (mode) {
  case TerminationMode::Goal:
    return "GOAL";
  case TerminationMode::Timeout:
    return "TIMEOUT";
  case TerminationMode::MaxTurns:
    return "MAX_TURNS";
  case TerminationMode::Aborted:
    return "ABORTED";
  case TerminationMode::Error:
    return "ERROR";
  case TerminationMode::CycleDetected:
    return "CYCLE_DETECTED";
  }
  return "ERROR";
}

std::string_view activity_kind_name(const ActivityKind kind) {
  switch (kind) {
  case ActivityKind::TurnStarted:
    return "turn_started";
  case ActivityKind::Delta:
    return "delta";
  case ActivityKind::ToolCallRequested:
    return "tool_call_requested";
  case ActivityKind::ToolCallFinished:
    return "tool_call_finished";
  case ActivityKind::Compressed:
    return "compressed";
  case ActivityKind::Pruned:
    return "pruned";
  case ActivityKind::TimeWarning:
    return "time_warning";
  case ActivityKind::LoopDetected:
    return "loop_detected";
  case ActivityKind::Recovery:
    return "recovery";
  case ActivityKind::Error:
    return "error";
  }
  return "unknown";
}

std::string final_warning_message(const TerminationMode reason) {
  std::string explanation;
  switch (reason) {
  case TerminationMode::Timeout:
    explanation = "You have exceeded the time limit.";
    break;
  case TerminationMode::MaxTurns:
    explanation = "You have exceeded the maximum number of turns.";
    break;
  case TerminationMode::Error:
    explanation = "You have stopped calling tools without finishing.";
    break;
  default:
    explanation = "Execution was interrupted.";
    break;
  }
  return explanation +
         " You have one final chance to complete the task with a short grace period. You MUST "
         "call `" +
         std::string(tools::kCompleteTaskToolName) +
         "` immediately with your best answer and explain that your investigation was "
         "interrupted. Do not call any other tools.";
}

struct AgentRunOrchestrator::RunState {
  RunState(const RunOptions &run_options, const std::chrono::milliseconds budget)
      : options(run_options), timer(budget, "Agent timed out."), cancel(run_options.cancel),
        deadline_link(timer.token(), [this] { cancel.cancel("Agent timed out."); }) {}

  [[nodiscard]] TerminationMode cancelled_mode() const {
    return timer.expired() ? TerminationMode::Timeout : TerminationMode::Aborted;
  }

  const RunOptions &options;
  DeadlineTimer timer;
  common::CancellationSource cancel;
  common::ScopedCancelCallback deadline_link;
  std::string prompt_id;
  std::uint32_t max_turns = 0;
  std::uint64_t turns = 0;
  std::uint64_t tool_calls = 0;
  bool time_warned = false;
  bool loop_fired = false;
  std::string loop_reason;
  std::unique_ptr<scheduler::ToolScheduler> scheduler;
};

AgentRunOrchestrator::AgentRunOrchestrator(OrchestratorDeps deps, AgentDefinition definition,
                                           config::Config config,
                                           std::filesystem::path workspace)
    : deps_(deps), definition_(std::move(definition)), config_(std::move(config)),
      workspace_(std::move(workspace)),
      agent_id_(common::random_id(definition_.name + "-", 3)),
      loop_detector_(LoopDetectorOptions::from_config(config_.loop_detection)) {
  tools_ = definition_.tools.empty() ? deps_.registry.subset(deps_.registry.names())
                                     : deps_.registry.subset(definition_.tools);
  if (tools_.lookup(tools::kCompleteTaskToolName) == nullptr) {
    tools_.register_tool(std::make_shared<tools::CompleteTaskTool>());
  }

  context_ = std::make_unique<context::ContextManager>(
      deps_.generator, context::ContextManagerOptions::from_config(config_),
      deps_.embedding_cache);

  TurnEngineOptions engine_options;
  engine_options.agent_id = agent_id_;
  engine_options.system_prompt = definition_.system_prompt;
  engine_options.tools = tools_.list_declarations();
  engine_options.temperature = definition_.temperature.value_or(config_.provider.temperature);
  engine_options.max_output_tokens = config_.provider.max_output_tokens;
  turn_engine_ = std::make_unique<TurnEngine>(deps_.generator, context_.get(),
                                              std::move(engine_options));
}

void AgentRunOrchestrator::emit(const RunState &state, ActivityEvent event) const {
  if (!state.options.on_activity) {
    return;
  }
  event.turn = state.turns;
  state.options.on_activity(event);
}

void AgentRunOrchestrator::check_time_warning(RunState &state) const {
  if (state.time_warned) {
    return;
  }
  const auto elapsed = state.timer.elapsed();
  const auto threshold =
      static_cast<double>(state.timer.budget().count()) * config_.agent.time_warning_fraction;
  if (static_cast<double>(elapsed.count()) < threshold) {
    return;
  }
  state.time_warned = true;
  observability::record_time_warning(agent_id_, elapsed, state.timer.budget());
  emit(state, ActivityEvent{.kind = ActivityKind::TimeWarning,
                            .text = "Time budget " +
                                    std::to_string(static_cast<int>(
                                        config_.agent.time_warning_fraction * 100)) +
                                    "% used"});
}

void AgentRunOrchestrator::prune_history(RunState &state) {
  const auto budget = config_.context.token_budget;
  if (budget == 0) {
    return;
  }
  auto history = turn_engine_->curated_history();
  if (history.empty()) {
    return;
  }
  // The newest model turn is answered by the pending tool responses; keep it.
  std::optional<providers::Message> open_turn;
  if (history.back().has_function_calls()) {
    open_turn = history.back();
    history.pop_back();
  }
  if (history.empty()) {
    return;
  }
  const auto before = history.size();
  auto pruned = context_->prune_history(history, turn_engine_->system_prompt(), budget);
  if (pruned.history.size() == before) {
    return;
  }
  if (open_turn.has_value()) {
    pruned.history.push_back(std::move(*open_turn));
  }
  turn_engine_->replace_history(std::move(pruned.history));
  emit(state, ActivityEvent{.kind = ActivityKind::Pruned,
                            .text = "Pruned history by " +
                                    std::to_string(pruned.stats.reduction_percentage) + "%"});
}

TurnOutcome AgentRunOrchestrator::model_turn(RunState &state,
                                             std::vector<providers::Message> content,
                                             const common::CancellationToken &cancel,
                                             const bool track_content) {
  common::CancellationSource turn_cancel(cancel);
  auto stream = turn_engine_->send_turn(std::move(content), turn_cancel.token());
  ++state.turns;
  emit(state, ActivityEvent{.kind = ActivityKind::TurnStarted});

  return stream.collect([&](const TurnEvent &event) {
    switch (event.kind) {
    case TurnEventKind::Delta:
      emit(state, ActivityEvent{.kind = ActivityKind::Delta, .text = event.text});
      if (track_content && !state.loop_fired) {
        const auto check = loop_detector_.add_content(event.text);
        if (check.detected) {
          state.loop_fired = true;
          state.loop_reason = check.detail;
          emit(state, ActivityEvent{.kind = ActivityKind::LoopDetected, .text = check.detail});
          turn_cancel.cancel("Loop detected");
        }
      }
      break;
    case TurnEventKind::Compressed:
      if (event.compression.has_value()) {
        emit(state, ActivityEvent{.kind = ActivityKind::Compressed,
                                  .text = "Compressed history from " +
                                          std::to_string(event.compression->original_tokens) +
                                          " to " +
                                          std::to_string(event.compression->summary_tokens) +
                                          " tokens"});
      }
      break;
    case TurnEventKind::Retry:
      observability::log_debug(std::string(kComponent),
                               "retrying model turn after attempt " +
                                   std::to_string(event.attempt) + ": " + event.text);
      break;
    case TurnEventKind::Error:
      if (!event.cancelled) {
        emit(state, ActivityEvent{.kind = ActivityKind::Error, .text = event.text});
      }
      break;
    case TurnEventKind::ToolCallRequested:
    case TurnEventKind::TurnComplete:
      break;
    }
  });
}

std::vector<scheduler::ToolCall>
AgentRunOrchestrator::execute_calls(RunState &state,
                                    const std::vector<providers::FunctionCall> &calls) {
  if (calls.empty()) {
    return {};
  }
  std::vector<scheduler::ToolCallRequest> requests;
  requests.reserve(calls.size());
  for (const auto &call : calls) {
    requests.push_back(scheduler::request_from_function_call(call, state.prompt_id));
    emit(state, ActivityEvent{.kind = ActivityKind::ToolCallRequested,
                              .text = call.args_json,
                              .tool_name = call.name,
                              .call_id = call.id});
  }
  auto done = state.scheduler->schedule(std::move(requests), state.cancel.token()).get();
  for (const auto &call : done) {
    if (reached_execution(call)) {
      ++state.tool_calls;
    }
    emit(state, ActivityEvent{.kind = ActivityKind::ToolCallFinished,
                              .text = std::string(scheduler::tool_call_state_name(call.state())),
                              .tool_name = call.request().name,
                              .call_id = call.request().call_id});
  }
  return done;
}

std::optional<std::string>
AgentRunOrchestrator::attempt_recovery(RunState &state, const TerminationMode reason,
                                       std::vector<providers::Message> pending) {
  const auto window = grace_window(std::chrono::milliseconds(config_.agent.grace_fixed_ms),
                                   state.timer.remaining(),
                                   std::chrono::milliseconds(config_.agent.min_useful_recovery_ms));
  if (!window.has_value()) {
    observability::log_info(std::string(kComponent),
                            "skipping recovery turn: " +
                                std::to_string(state.timer.remaining().count()) +
                                "ms left in the run");
    if (!pending.empty()) {
      turn_engine_->append_history(pending);
    }
    return std::nullopt;
  }

  const std::string warning = final_warning_message(reason);
  emit(state, ActivityEvent{.kind = ActivityKind::Recovery, .text = warning});
  observability::log_info(std::string(kComponent),
                          "recovery turn with " + std::to_string(window->count()) +
                              "ms grace period");

  DeadlineTimer grace(*window, "Grace period timed out.");
  common::CancellationSource grace_cancel(state.options.cancel);
  common::ScopedCancelCallback grace_link(
      grace.token(), [&grace_cancel] { grace_cancel.cancel("Grace period timed out."); });

  auto content = pending;
  content.push_back(providers::Message::user(warning));
  auto outcome = model_turn(state, std::move(content), grace_cancel.token(), false);
  grace.stop();
  if (outcome.error.has_value() || !outcome.completed) {
    // A failed turn leaves curated history untouched; keep the real tool results.
    if (!pending.empty()) {
      turn_engine_->append_history(pending);
    }
    return std::nullopt;
  }

  std::optional<std::string> result;
  std::vector<providers::Message> responses;
  for (const auto &call : outcome.calls) {
    if (!result.has_value() && is_complete_task(call)) {
      result = completion_result(call);
      if (result.has_value()) {
        responses.push_back(response_message(call, "Task completed.", false));
        continue;
      }
    }
    responses.push_back(response_message(call, "Not executed: the run is ending.", true));
  }
  if (!responses.empty()) {
    turn_engine_->append_history(responses);
  }
  return result;
}

void AgentRunOrchestrator::close_open_turn(const std::vector<providers::Message> &pending) {
  if (!pending.empty() && pending.front().is_function_response()) {
    turn_engine_->append_history(pending);
  }
  const auto history = turn_engine_->curated_history();
  if (history.empty() || !history.back().has_function_calls()) {
    return;
  }
  std::vector<providers::Message> responses;
  for (const auto &call : history.back().function_calls) {
    responses.push_back(response_message(call, "Tool call was cancelled.", true));
  }
  turn_engine_->append_history(responses);
}

std::string AgentRunOrchestrator::failure_reason(const TerminationMode mode) const {
  switch (mode) {
  case TerminationMode::Timeout:
    return "Agent timed out after " +
           format_minutes(std::chrono::milliseconds(
               definition_.timeout_ms.value_or(config_.agent.timeout_ms))) +
           " minutes.";
  case TerminationMode::MaxTurns:
    return "Agent reached max turns limit (" +
           std::to_string(definition_.max_turns.value_or(config_.agent.max_turns)) + ").";
  case TerminationMode::Aborted:
    return "Run cancelled.";
  case TerminationMode::CycleDetected:
    return "Loop detected.";
  case TerminationMode::Error:
    return "Agent execution was terminated before completion.";
  case TerminationMode::Goal:
    break;
  }
  return "";
}

RunResult AgentRunOrchestrator::run(const std::string &prompt, const RunOptions &options) {
  const auto started = std::chrono::steady_clock::now();
  ++run_count_;

  RunState state(options, std::chrono::milliseconds(
                              definition_.timeout_ms.value_or(config_.agent.timeout_ms)));
  state.max_turns = definition_.max_turns.value_or(config_.agent.max_turns);
  state.prompt_id = agent_id_ + "#" + std::to_string(run_count_);

  scheduler::SchedulerOptions scheduler_options;
  scheduler_options.workspace = workspace_;
  scheduler_options.agent_id = agent_id_;
  scheduler_options.truncation = scheduler::TruncationOptions::from_config(config_.scheduler);
  // A human reviewing confirmations sees one action at a time.
  if (!options.interactive) {
    scheduler_options.max_parallel = config_.agent.autonomous_tool_parallelism;
  } else if (config_.security.interactive) {
    scheduler_options.max_parallel = 1;
  } else {
    scheduler_options.max_parallel = config_.agent.tool_parallelism;
  }
  scheduler_options.on_awaiting_confirmation = [&state](const bool waiting) {
    if (waiting) {
      state.timer.pause();
    } else {
      state.timer.resume();
    }
  };
  state.scheduler = std::make_unique<scheduler::ToolScheduler>(
      tools_, deps_.policy, deps_.executor, deps_.bus, std::move(scheduler_options));

  loop_detector_.reset(state.prompt_id);
  observability::record_agent_start(agent_id_, deps_.generator.name());

  RunResult result;
  std::optional<TerminationMode> mode;
  bool recoverable = false;
  std::vector<providers::Message> pending{providers::Message::user(prompt)};

  try {
    while (!mode.has_value()) {
      if (state.cancel.cancelled()) {
        mode = state.cancelled_mode();
        break;
      }
      if (state.turns >= state.max_turns) {
        mode = TerminationMode::MaxTurns;
        recoverable = true;
        break;
      }
      check_time_warning(state);
      prune_history(state);

      auto outcome = model_turn(state, std::move(pending), state.cancel.token(), true);
      pending.clear();

      if (state.loop_fired) {
        mode = TerminationMode::CycleDetected;
        result.reason = state.loop_reason;
        break;
      }
      if (outcome.cancelled || state.cancel.cancelled()) {
        mode = state.cancelled_mode();
        break;
      }
      if (outcome.error.has_value()) {
        mode = TerminationMode::Error;
        result.reason = *outcome.error;
        break;
      }
      if (outcome.calls.empty()) {
        if (options.interactive) {
          mode = TerminationMode::Goal;
          result.output = outcome.text;
        } else {
          mode = TerminationMode::Error;
          result.reason = std::string(kNoCompletionReason);
          recoverable = true;
        }
        break;
      }

      for (const auto &call : outcome.calls) {
        const auto check = loop_detector_.add_tool_call(call);
        if (check.detected) {
          state.loop_fired = true;
          state.loop_reason = check.detail;
          emit(state, ActivityEvent{.kind = ActivityKind::LoopDetected, .text = check.detail});
          break;
        }
      }
      if (state.loop_fired) {
        std::vector<providers::Message> skipped;
        for (const auto &call : outcome.calls) {
          skipped.push_back(response_message(call, "Not executed: loop detected.", true));
        }
        turn_engine_->append_history(skipped);
        mode = TerminationMode::CycleDetected;
        result.reason = state.loop_reason;
        break;
      }

      std::optional<std::size_t> completion;
      std::vector<providers::FunctionCall> work;
      for (std::size_t i = 0; i < outcome.calls.size(); ++i) {
        if (!completion.has_value() && is_complete_task(outcome.calls[i])) {
          completion = i;
        } else {
          work.push_back(outcome.calls[i]);
        }
      }

      auto executed = execute_calls(state, work);
      std::vector<providers::Message> responses;
      responses.reserve(outcome.calls.size());
      std::size_t next_executed = 0;
      std::optional<std::string> final_result;
      for (std::size_t i = 0; i < outcome.calls.size(); ++i) {
        const auto &call = outcome.calls[i];
        if (completion == i) {
          final_result = completion_result(call);
          responses.push_back(
              final_result.has_value()
                  ? response_message(call, "Task completed.", false)
                  : response_message(call, "Missing required \"result\" argument", true));
          continue;
        }
        if (next_executed < executed.size()) {
          responses.push_back(providers::Message::tool(executed[next_executed++].to_response()));
        } else {
          responses.push_back(response_message(call, "Tool call was not executed.", true));
        }
      }
      check_time_warning(state);

      if (state.cancel.cancelled()) {
        turn_engine_->append_history(responses);
        mode = state.cancelled_mode();
        break;
      }
      if (completion.has_value()) {
        turn_engine_->append_history(responses);
        if (final_result.has_value()) {
          mode = TerminationMode::Goal;
          result.output = *final_result;
        } else {
          mode = TerminationMode::Error;
          result.reason = "complete_task was called without a \"result\" string";
        }
        break;
      }
      pending = std::move(responses);
    }

    if (recoverable && !options.interactive && mode.has_value()) {
      auto recovered = attempt_recovery(state, *mode, std::exchange(pending, {}));
      if (recovered.has_value()) {
        mode = TerminationMode::Goal;
        result.reason.clear();
        result.output = *recovered;
      }
    }
  } catch (const std::exception &e) {
    observability::record_error(std::string(kComponent), e.what());
    mode = TerminationMode::Error;
    result.reason = std::string("Internal error: ") + e.what();
  }
  close_open_turn(pending);

  state.timer.stop();
  state.scheduler.reset();

  result.mode = mode.value_or(TerminationMode::Error);
  if (result.mode != TerminationMode::Goal && result.reason.empty()) {
    result.reason = failure_reason(result.mode);
  }
  if (result.mode == TerminationMode::Goal) {
    result.reason.clear();
  }

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  result.summary = RunSummary{.agent_id = agent_id_,
                              .mode = result.mode,
                              .turns = state.turns,
                              .tool_calls = state.tool_calls,
                              .duration_ms = static_cast<std::uint64_t>(duration.count())};

  observability::record_agent_end(observability::AgentEndEvent{
      .agent_id = agent_id_,
      .termination = std::string(termination_mode_name(result.mode)),
      .reason = result.reason,
      .turns = state.turns,
      .tool_calls = state.tool_calls,
      .duration = duration});
  if (options.on_complete) {
    options.on_complete(result.summary);
  }
  return result;
}

} // namespace drover::agent
