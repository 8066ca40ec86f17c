#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "drover/agent/agent_registry.hpp"
#include "drover/agent/deadline_timer.hpp"
#include "drover/agent/delegate_tool.hpp"
#include "drover/agent/orchestrator.hpp"
#include "drover/agent/turn_engine.hpp"
#include "drover/bus/message_bus.hpp"
#include "drover/common/json_util.hpp"
#include "drover/context/context_manager.hpp"
#include "drover/scheduler/executor.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

namespace {

namespace agent = drover::agent;
namespace providers = drover::providers;
namespace testing = drover::testing;
using namespace std::chrono_literals;

providers::FunctionCall complete(const std::string &result) {
  return testing::make_call("complete_task",
                            "{\"result\":" + drover::common::json_quote(result) + "}");
}

/// Collaborators shared by every orchestrator built in a test.
struct AgentHarness {
  std::shared_ptr<testing::RecordingTool> add_tool(const std::string &name) {
    auto tool = std::make_shared<testing::RecordingTool>(name);
    registry.register_tool(tool);
    return tool;
  }

  agent::OrchestratorDeps deps() {
    return agent::OrchestratorDeps{.generator = generator,
                                   .registry = registry,
                                   .policy = policy,
                                   .executor = executor,
                                   .bus = bus,
                                   .embedding_cache = nullptr};
  }

  std::unique_ptr<agent::AgentRunOrchestrator> make(drover::config::Config config) {
    return std::make_unique<agent::AgentRunOrchestrator>(deps(), agent::generalist_definition(),
                                                         std::move(config), workspace.path());
  }

  std::unique_ptr<agent::AgentRunOrchestrator> make() { return make(testing::test_config()); }

  testing::TempWorkspace workspace;
  testing::ScriptedGenerator generator;
  drover::tools::ToolRegistry registry;
  testing::FixedPolicy policy;
  drover::scheduler::RegistryToolExecutor executor{registry};
  drover::bus::MessageBus bus;
};

bool has_activity(const std::vector<agent::ActivityEvent> &events, agent::ActivityKind kind) {
  for (const auto &event : events) {
    if (event.kind == kind) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_agent_tests(std::vector<drover::tests::TestCase> &tests) {
  using drover::tests::require;
  using agent::TerminationMode;

  // Turn engine

  tests.push_back({"agent_turn_retries_invalid_output_with_hotter_temperature", [] {
                     testing::ScriptedGenerator generator;
                     generator.push(testing::text_reply("   "));
                     generator.push(testing::empty_reply());
                     generator.push(testing::text_reply("ok"));
                     agent::TurnEngine engine(generator, nullptr, {});

                     std::uint32_t retries = 0;
                     const auto outcome =
                         engine.send_turn({providers::Message::user("hi")})
                             .collect([&retries](const agent::TurnEvent &event) {
                               if (event.kind == agent::TurnEventKind::Retry) {
                                 ++retries;
                               }
                             });
                     require(outcome.completed && !outcome.error.has_value(), "turn completed");
                     require(outcome.text == "ok", "final text");
                     require(outcome.attempts == 3 && retries == 2, "two retries");

                     const auto requests = generator.requests();
                     require(requests.size() == 3, "three attempts");
                     require(std::fabs(requests[0].temperature - 0.7) < 1e-9 &&
                                 std::fabs(requests[1].temperature - 1.0) < 1e-9 &&
                                 std::fabs(requests[2].temperature - 1.3) < 1e-9,
                             "temperature steps up");
                     require(engine.curated_history().size() == 2, "only the valid turn curated");
                     require(engine.comprehensive_history().size() == 3,
                             "rejected output kept in the full record");
                     require(engine.turns_completed() == 1, "one turn");
                   }});

  tests.push_back({"agent_turn_gives_up_after_max_attempts", [] {
                     testing::ScriptedGenerator generator;
                     generator.set_fallback(testing::empty_reply());
                     agent::TurnEngine engine(generator, nullptr, {});
                     const auto outcome = engine.send_turn({providers::Message::user("hi")}).collect();
                     require(!outcome.completed, "not completed");
                     require(outcome.error.has_value() &&
                                 *outcome.error ==
                                     "Model returned an empty or invalid response after 3 attempts.",
                             outcome.error.value_or("no error"));
                     require(engine.curated_history().empty(), "failed turn leaves history alone");
                   }});

  tests.push_back({"agent_turn_provider_error_is_not_retried", [] {
                     testing::ScriptedGenerator generator;
                     testing::ScriptedReply failing;
                     failing.error = providers::GeneratorError{
                         .code = providers::GeneratorErrorCode::Auth,
                         .status = 401,
                         .message = "bad key",
                         .retry_after_ms = std::nullopt};
                     generator.push(failing);
                     agent::TurnEngine engine(generator, nullptr, {});
                     const auto outcome = engine.send_turn({providers::Message::user("hi")}).collect();
                     require(outcome.error.has_value() && !outcome.cancelled, "error surfaced");
                     require(generator.calls() == 1, "single attempt");
                   }});

  tests.push_back({"agent_turns_run_one_at_a_time", [] {
                     testing::ScriptedGenerator generator;
                     auto slow = testing::text_reply("first answer");
                     slow.delay = 100ms;
                     generator.push(slow);
                     generator.push(testing::text_reply("second answer"));
                     agent::TurnEngine engine(generator, nullptr, {});
                     auto first = engine.send_turn({providers::Message::user("one")});
                     auto second = engine.send_turn({providers::Message::user("two")});
                     require(second.collect().text == "second answer", "second turn");
                     require(first.collect().text == "first answer", "first turn");

                     const auto history = engine.curated_history();
                     require(history.size() == 4, "both turns recorded");
                     require(history[0].text == "one" && history[1].text == "first answer" &&
                                 history[2].text == "two" && history[3].text == "second answer",
                             "turns recorded in submission order");
                     require(generator.requests()[1].messages.size() == 3,
                             "second turn sees the first");
                   }});

  tests.push_back({"agent_turn_sanitizes_tool_calls", [] {
                     testing::ScriptedGenerator generator;
                     auto unnamed = testing::make_call("  ", "{}", "x");
                     auto unidentified = testing::make_call("inspect", "", "");
                     unidentified.id.clear();
                     generator.push(testing::calls_reply({unnamed, unidentified}));
                     agent::TurnEngine engine(generator, nullptr, {});
                     const auto outcome = engine.send_turn({providers::Message::user("go")}).collect();
                     require(outcome.calls.size() == 1, "unnamed call dropped");
                     require(outcome.calls[0].name == "inspect", "named call kept");
                     require(outcome.calls[0].id.rfind("call_", 0) == 0, "id assigned");
                     require(outcome.calls[0].args_json == "{}", "empty args normalized");
                   }});

  tests.push_back({"agent_turn_cancelled_before_start", [] {
                     testing::ScriptedGenerator generator;
                     agent::TurnEngine engine(generator, nullptr, {});
                     drover::common::CancellationSource source;
                     source.cancel("stop");
                     const auto outcome =
                         engine.send_turn({providers::Message::user("hi")}, source.token()).collect();
                     require(outcome.cancelled && outcome.error.has_value(), "cancelled");
                     require(generator.calls() == 0, "no model call");
                   }});

  tests.push_back({"agent_turn_compresses_when_new_content_crosses_threshold", [] {
                     testing::ScriptedGenerator generator;
                     generator.push(testing::text_reply("Goal: short."));
                     generator.push(testing::text_reply("ok"));
                     drover::context::ContextManagerOptions options;
                     options.compression.context_window = 2000;
                     options.compression.threshold = 0.5;
                     drover::context::ContextManager manager(generator, options);
                     agent::TurnEngine engine(generator, &manager, {});

                     std::vector<providers::Message> history;
                     for (int i = 0; i < 7; ++i) {
                       const std::string body(400, static_cast<char>('a' + i));
                       history.push_back(i % 2 == 0 ? providers::Message::user(body)
                                                    : providers::Message::model(body));
                     }
                     engine.replace_history(history);

                     bool compressed = false;
                     const auto outcome =
                         engine.send_turn({providers::Message::user(std::string(2000, 'q'))})
                             .collect([&compressed](const agent::TurnEvent &event) {
                               compressed = compressed ||
                                            event.kind == agent::TurnEventKind::Compressed;
                             });
                     require(outcome.completed, "turn completed");
                     require(compressed, "compression reported");
                     const auto requests = generator.requests();
                     require(requests.size() == 2, "summary call then the turn");
                     require(requests[1].messages.size() == 4,
                             "summary, ack, preserved tail, new content");
                     require(requests[1].messages.front().text == "Goal: short.",
                             "turn sent with the summary");
                   }});

  tests.push_back({"agent_valid_model_message_rules", [] {
                     require(!agent::is_valid_model_message(providers::Message::model("  ")),
                             "blank text");
                     require(agent::is_valid_model_message(providers::Message::model("x")), "text");
                     auto thought = providers::Message::model("");
                     thought.thought = true;
                     require(agent::is_valid_model_message(thought), "thought");
                     require(agent::is_valid_model_message(providers::Message::model(
                                 "", {testing::make_call("ls")})),
                             "tool call");
                   }});

  // Deadline timer

  tests.push_back({"agent_deadline_timer_expires_and_cancels", [] {
                     agent::DeadlineTimer timer(50ms, "Too slow");
                     require(timer.token().wait_for(2000ms), "fires");
                     require(timer.expired(), "expired");
                     require(timer.remaining() == 0ms, "nothing left");
                     require(timer.token().reason() == "Too slow", "reason");
                   }});

  tests.push_back({"agent_deadline_timer_pause_stops_the_clock", [] {
                     agent::DeadlineTimer timer(150ms, "late");
                     timer.pause();
                     timer.pause();
                     std::this_thread::sleep_for(300ms);
                     require(!timer.expired() && timer.paused(), "paused timers do not fire");
                     require(timer.elapsed() < 150ms, "paused time not counted");
                     timer.resume();
                     require(timer.paused(), "pauses nest");
                     timer.resume();
                     require(timer.token().wait_for(2000ms), "fires after resume");
                   }});

  tests.push_back({"agent_deadline_timer_stop_prevents_firing", [] {
                     agent::DeadlineTimer timer(50ms, "late");
                     timer.stop();
                     require(!timer.token().wait_for(200ms), "stopped timer never fires");
                     require(!timer.expired(), "not expired");
                   }});

  tests.push_back({"agent_grace_window_clips_to_remaining_time", [] {
                     require(agent::grace_window(60000ms, 300000ms, 5000ms) == 60000ms, "fixed");
                     require(agent::grace_window(60000ms, 7000ms, 5000ms) == 7000ms, "clipped");
                     const auto boundary = agent::grace_window(60000ms, 5000ms, 1000ms);
                     require(boundary.has_value() && *boundary <= 5000ms,
                             "never longer than what is left");
                     require(!agent::grace_window(60000ms, 3000ms, 5000ms).has_value(),
                             "too little time");
                     require(!agent::grace_window(60000ms, 0ms, 0ms).has_value(), "none left");
                   }});

  // Orchestrator

  tests.push_back({"agent_run_goal_via_complete_task", [] {
                     AgentHarness harness;
                     harness.generator.push(testing::calls_reply({complete("All done")}));
                     auto orchestrator = harness.make();
                     std::optional<agent::RunSummary> summary;
                     agent::RunOptions options;
                     options.on_complete = [&summary](const agent::RunSummary &s) { summary = s; };
                     const auto result = orchestrator->run("Do the thing", options);
                     require(result.mode == TerminationMode::Goal, result.reason);
                     require(result.output == "All done", "complete_task result");
                     require(result.reason.empty(), "no reason on goal");
                     require(summary.has_value() && summary->mode == TerminationMode::Goal,
                             "completion hook");
                     require(summary->turns == 1 && summary->tool_calls == 0, "counts");
                     require(summary->agent_id.rfind("generalist-", 0) == 0, "agent id");
                   }});

  tests.push_back({"agent_run_feeds_tool_results_back", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     inspect->set_output("inspect says hi");
                     harness.generator.push(
                         testing::calls_reply({testing::make_call("inspect", "{}", "p1")}));
                     harness.generator.push(testing::calls_reply({complete("finished")}));
                     auto orchestrator = harness.make();
                     std::vector<agent::ActivityEvent> events;
                     agent::RunOptions options;
                     options.on_activity = [&events](const agent::ActivityEvent &e) {
                       events.push_back(e);
                     };
                     const auto result = orchestrator->run("Investigate", options);
                     require(result.mode == TerminationMode::Goal, result.reason);
                     require(inspect->execution_count() == 1, "tool executed");
                     require(result.summary.tool_calls == 1 && result.summary.turns == 2, "counts");

                     const auto second = harness.generator.requests()[1];
                     require(!second.messages.empty() &&
                                 second.messages.back().is_function_response(),
                             "tool response sent to the model");
                     require(second.messages.back().function_response->call_id == "p1", "call id");
                     require(second.messages.back().function_response->output.find(
                                 "inspect says hi") != std::string::npos,
                             "tool output");
                     require(has_activity(events, agent::ActivityKind::ToolCallFinished),
                             "activity reported");

                     bool declared = false;
                     const auto first = harness.generator.requests()[0];
                     for (const auto &tool : first.tools) {
                       declared = declared || tool.name == "complete_task";
                     }
                     require(declared, "complete_task always offered");
                   }});

  tests.push_back({"agent_run_without_complete_task_is_an_error", [] {
                     AgentHarness harness;
                     harness.generator.push(testing::text_reply("I think it is done."));
                     harness.generator.push(testing::text_reply("Still nothing to call."));
                     auto orchestrator = harness.make();
                     const auto result = orchestrator->run("Fix it");
                     require(result.mode == TerminationMode::Error, "error");
                     require(result.reason ==
                                 "Agent stopped calling tools without calling complete_task",
                             result.reason);
                     const auto requests = harness.generator.requests();
                     require(requests.size() == 2, "one recovery turn");
                     require(requests[1].messages.back().text.rfind(
                                 "You have stopped calling tools without finishing.", 0) == 0,
                             "final warning sent");
                   }});

  tests.push_back({"agent_run_recovers_after_missing_completion", [] {
                     AgentHarness harness;
                     harness.generator.push(testing::text_reply("Done, I believe."));
                     harness.generator.push(testing::calls_reply({complete("Recovered answer")}));
                     auto orchestrator = harness.make();
                     std::vector<agent::ActivityEvent> events;
                     agent::RunOptions options;
                     options.on_activity = [&events](const agent::ActivityEvent &e) {
                       events.push_back(e);
                     };
                     const auto result = orchestrator->run("Fix it", options);
                     require(result.mode == TerminationMode::Goal, result.reason);
                     require(result.output == "Recovered answer", "recovered output");
                     require(has_activity(events, agent::ActivityKind::Recovery), "recovery event");
                   }});

  tests.push_back({"agent_run_max_turns_with_recovery", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     harness.generator.push(testing::calls_reply({testing::make_call("inspect")}));
                     harness.generator.push(testing::calls_reply({testing::make_call("inspect")}));
                     harness.generator.push(
                         testing::calls_reply({testing::make_call("inspect"), complete("Partial")}));
                     auto config = testing::test_config();
                     config.agent.max_turns = 2;
                     auto orchestrator = harness.make(config);
                     const auto result = orchestrator->run("Explore");
                     require(result.mode == TerminationMode::Goal, result.reason);
                     require(result.output == "Partial", "recovery answer");
                     require(inspect->execution_count() == 2,
                             "tools requested during recovery are not run");
                     require(result.summary.turns == 3, "two turns plus recovery");

                     const auto last = harness.generator.requests().back();
                     require(last.messages.back().text.rfind(
                                 "You have exceeded the maximum number of turns.", 0) == 0,
                             "max turns warning");
                   }});

  tests.push_back({"agent_run_max_turns_without_recovery_time", [] {
                     AgentHarness harness;
                     (void)harness.add_tool("inspect");
                     harness.generator.set_fallback(
                         testing::calls_reply({testing::make_call("inspect")}));
                     auto config = testing::test_config();
                     config.agent.max_turns = 2;
                     config.agent.timeout_ms = 60'000;
                     config.agent.min_useful_recovery_ms = 120'000;
                     auto orchestrator = harness.make(config);
                     const auto result = orchestrator->run("Explore");
                     require(result.mode == TerminationMode::MaxTurns, "max turns");
                     require(result.reason == "Agent reached max turns limit (2).", result.reason);
                     require(harness.generator.calls() == 2, "no recovery turn");
                     const auto history = orchestrator->turn_engine().curated_history();
                     require(!history.empty() && history.back().is_function_response(),
                             "last tool responses kept in history");
                   }});

  tests.push_back({"agent_run_recovery_is_clipped_to_the_run_deadline", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     inspect->set_delay(1000ms);
                     harness.generator.push(testing::calls_reply({testing::make_call("inspect")}));
                     auto stalled = testing::calls_reply({complete("too late")});
                     stalled.delay = 20'000ms;
                     harness.generator.push(stalled);
                     auto config = testing::test_config();
                     config.agent.max_turns = 1;
                     config.agent.timeout_ms = 1500;
                     config.agent.grace_fixed_ms = 60'000;
                     config.agent.min_useful_recovery_ms = 100;
                     auto orchestrator = harness.make(config);

                     const auto started = std::chrono::steady_clock::now();
                     const auto result = orchestrator->run("Explore");
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.mode == TerminationMode::MaxTurns, result.reason);
                     require(harness.generator.calls() == 2, "recovery turn attempted");
                     require(elapsed < 1500ms + 700ms, "grace period ends with the run budget");
                     const auto history = orchestrator->turn_engine().curated_history();
                     require(!history.empty() && history.back().is_function_response(),
                             "tool result kept after the cut-off recovery");
                   }});

  tests.push_back({"agent_run_cancelled_before_start_is_aborted", [] {
                     AgentHarness harness;
                     auto orchestrator = harness.make();
                     drover::common::CancellationSource source;
                     source.cancel("user stop");
                     agent::RunOptions options;
                     options.cancel = source.token();
                     const auto result = orchestrator->run("anything", options);
                     require(result.mode == TerminationMode::Aborted, "aborted");
                     require(result.reason == "Run cancelled.", result.reason);
                     require(harness.generator.calls() == 0, "no model call");
                   }});

  tests.push_back({"agent_run_cancelled_during_tool_is_aborted", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     inspect->set_delay(5000ms);
                     harness.generator.set_fallback(
                         testing::calls_reply({testing::make_call("inspect")}));
                     auto orchestrator = harness.make();
                     drover::common::CancellationSource source;
                     agent::RunOptions options;
                     options.cancel = source.token();
                     std::thread canceller([&] {
                       (void)inspect->wait_started(5000ms);
                       source.cancel("user stop");
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = orchestrator->run("slow work", options);
                     canceller.join();
                     require(result.mode == TerminationMode::Aborted, result.reason);
                     require(std::chrono::steady_clock::now() - started < 4000ms,
                             "cancellation interrupts the tool");
                     require(inspect->was_cancelled(), "tool saw the cancellation");
                   }});

  tests.push_back({"agent_run_deadline_is_timeout", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     inspect->set_delay(5000ms);
                     harness.generator.set_fallback(
                         testing::calls_reply({testing::make_call("inspect")}));
                     auto config = testing::test_config();
                     config.agent.timeout_ms = 200;
                     auto orchestrator = harness.make(config);
                     const auto result = orchestrator->run("slow work");
                     require(result.mode == TerminationMode::Timeout, result.reason);
                     require(result.reason.rfind("Agent timed out after", 0) == 0, result.reason);
                     require(harness.generator.calls() == 1, "no recovery after a timeout");
                   }});

  tests.push_back({"agent_run_identical_calls_are_a_cycle", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     harness.generator.set_fallback(
                         testing::calls_reply({testing::make_call("inspect", R"({"path":"a"})")}));
                     auto orchestrator = harness.make();
                     std::vector<agent::ActivityEvent> events;
                     agent::RunOptions options;
                     options.on_activity = [&events](const agent::ActivityEvent &e) {
                       events.push_back(e);
                     };
                     const auto result = orchestrator->run("Loop forever", options);
                     require(result.mode == TerminationMode::CycleDetected, result.reason);
                     require(inspect->execution_count() < 5, "looping call never executed again");
                     require(inspect->execution_count() == 4, "four executions before detection");
                     require(!result.reason.empty(), "reason reported");
                     require(has_activity(events, agent::ActivityKind::LoopDetected),
                             "loop activity");
                   }});

  tests.push_back({"agent_run_invalid_completion_args_is_an_error", [] {
                     AgentHarness harness;
                     harness.generator.push(
                         testing::calls_reply({testing::make_call("complete_task", "{}")}));
                     auto orchestrator = harness.make();
                     const auto result = orchestrator->run("Finish");
                     require(result.mode == TerminationMode::Error, "error");
                     require(result.reason == "complete_task was called without a \"result\" string",
                             result.reason);
                     require(harness.generator.calls() == 1, "no recovery");
                   }});

  tests.push_back({"agent_run_model_error_ends_the_run", [] {
                     AgentHarness harness;
                     testing::ScriptedReply failing;
                     failing.error = providers::GeneratorError{
                         .code = providers::GeneratorErrorCode::Server,
                         .status = 503,
                         .message = "unavailable",
                         .retry_after_ms = std::nullopt};
                     harness.generator.push(failing);
                     auto orchestrator = harness.make();
                     const auto result = orchestrator->run("Anything");
                     require(result.mode == TerminationMode::Error, "error");
                     require(result.reason.find("unavailable") != std::string::npos, result.reason);
                   }});

  tests.push_back({"agent_interactive_run_ends_on_plain_answer", [] {
                     AgentHarness harness;
                     harness.generator.push(testing::text_reply("Hello there"));
                     harness.generator.push(testing::text_reply("Still here"));
                     auto orchestrator = harness.make();
                     agent::RunOptions options;
                     options.interactive = true;
                     const auto first = orchestrator->run("hi", options);
                     require(first.mode == TerminationMode::Goal, first.reason);
                     require(first.output == "Hello there", "answer");
                     const auto second = orchestrator->run("again", options);
                     require(second.output == "Still here", "second answer");
                     require(orchestrator->turn_engine().curated_history().size() == 4,
                             "history survives across runs");
                     require(harness.generator.requests()[1].messages.size() == 3,
                             "second prompt sees the first exchange");
                   }});

  tests.push_back({"agent_interactive_max_turns_keeps_tool_results_for_next_prompt", [] {
                     AgentHarness harness;
                     auto inspect = harness.add_tool("inspect");
                     inspect->set_output("inspect result");
                     harness.generator.push(
                         testing::calls_reply({testing::make_call("inspect", "{}", "c1")}));
                     harness.generator.push(testing::text_reply("Back to you"));
                     auto config = testing::test_config();
                     config.agent.max_turns = 1;
                     auto orchestrator = harness.make(config);
                     agent::RunOptions options;
                     options.interactive = true;

                     const auto first = orchestrator->run("first", options);
                     require(first.mode == TerminationMode::MaxTurns, first.reason);
                     require(inspect->execution_count() == 1, "tool ran");

                     const auto second = orchestrator->run("second", options);
                     require(second.mode == TerminationMode::Goal, second.reason);
                     const auto requests = harness.generator.requests();
                     require(requests.size() == 2, "one turn per prompt");
                     const auto &messages = requests[1].messages;
                     require(messages.size() == 4, "user, model, tool, user");
                     require(messages[1].has_function_calls(), "model turn with the call");
                     require(messages[2].is_function_response() &&
                                 messages[2].function_response->call_id == "c1",
                             "call answered before the next prompt");
                     require(messages[2].function_response->output.find("inspect result") !=
                                 std::string::npos,
                             "real tool result kept");
                     require(messages[3].text == "second", "new prompt last");
                   }});

  tests.push_back({"agent_termination_names", [] {
                     require(agent::termination_mode_name(TerminationMode::CycleDetected) ==
                                 "CYCLE_DETECTED",
                             "cycle");
                     require(agent::termination_mode_name(TerminationMode::MaxTurns) == "MAX_TURNS",
                             "max turns");
                     require(agent::activity_kind_name(agent::ActivityKind::TimeWarning) ==
                                 "time_warning",
                             "activity");
                   }});

  // Agent registry and delegation

  tests.push_back({"agent_registry_validates_definitions", [] {
                     agent::AgentRegistry registry;
                     require(registry.find("Generalist") != nullptr, "generalist built in");
                     require(!registry.register_definition({}).ok(), "name required");
                     agent::AgentDefinition reviewer;
                     reviewer.name = "Reviewer";
                     reviewer.description = "Reviews diffs.";
                     require(!registry.register_definition(reviewer).ok(), "prompt required");
                     reviewer.system_prompt = "You review code.";
                     reviewer.max_turns = 0;
                     require(!registry.register_definition(reviewer).ok(), "positive max turns");
                     reviewer.max_turns = 5;
                     require(registry.register_definition(reviewer).ok(), "registered");
                     require(registry.find("reviewer") != nullptr, "case-insensitive");
                     require(registry.size() == 2, "two agents");
                     require(registry.describe().find("- Reviewer: Reviews diffs.") !=
                                 std::string::npos,
                             registry.describe());
                   }});

  tests.push_back({"agent_delegate_tool_reports_subagent_outcome", [] {
                     agent::AgentRegistry agents;
                     std::string seen_task;
                     agent::DelegateToAgentTool tool(
                         agents, [&seen_task](const agent::AgentDefinition &, const std::string &task,
                                              const drover::common::CancellationToken &) {
                           seen_task = task;
                           agent::RunResult run;
                           run.mode = TerminationMode::MaxTurns;
                           run.reason = "Agent reached max turns limit (3).";
                           run.summary.turns = 3;
                           return run;
                         });
                     require(tool.parameters_schema().find("\"generalist\"") != std::string::npos,
                             "agent names enumerated");

                     drover::tools::ToolContext ctx;
                     ctx.agent_id = "main";
                     const auto result = tool.execute(
                         {{"agent_name", "\"generalist\""}, {"task", "\"count files\""}}, ctx);
                     require(result.ok(), "executes");
                     require(seen_task == "count files", "task forwarded");
                     require(!result.value().success, "non-goal runs fail the call");
                     require(result.value().metadata.at("termination") == "MAX_TURNS", "metadata");
                     require(result.value().output.find("MAX_TURNS") != std::string::npos,
                             result.value().output);

                     const auto unknown =
                         tool.execute({{"agent_name", "\"nobody\""}, {"task", "\"x\""}}, ctx);
                     require(!unknown.ok() && unknown.error() == "Unknown agent: nobody",
                             "unknown agent");
                   }});

  tests.push_back({"agent_subagent_runner_hides_delegate_tool", [] {
                     AgentHarness harness;
                     agent::AgentRegistry agents;
                     (void)harness.add_tool("inspect");
                     harness.registry.register_tool(std::make_shared<agent::DelegateToAgentTool>(
                         agents, agent::make_subagent_runner(harness.deps(),
                                                             testing::test_config(),
                                                             harness.workspace.path())));
                     harness.generator.push(testing::calls_reply({complete("sub result")}));

                     auto runner = agent::make_subagent_runner(harness.deps(), testing::test_config(),
                                                               harness.workspace.path());
                     const auto run = runner(*agents.find("generalist"), "summarize", {});
                     require(run.mode == TerminationMode::Goal, run.reason);
                     require(run.output == "sub result", "sub-agent output");
                     const auto first = harness.generator.requests()[0];
                     for (const auto &tool : first.tools) {
                       require(tool.name != agent::kDelegateToolName, "no recursive delegation");
                     }
                     require(harness.generator.requests()[0].messages.front().text == "summarize",
                             "task is the prompt");
                   }});
}
