#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "drover/bus/message_bus.hpp"
#include "drover/common/fs.hpp"
#include "drover/scheduler/executor.hpp"
#include "drover/scheduler/tool_scheduler.hpp"
#include "drover/scheduler/truncation.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace {

namespace scheduler = drover::scheduler;
namespace testing = drover::testing;
using scheduler::ToolCallState;

constexpr auto kWait = std::chrono::seconds(10);

/// Registry, policy, executor and bus wired to one scheduler.
struct Harness {
  explicit Harness(scheduler::SchedulerOptions options = {}) : executor(registry) {
    if (options.workspace.empty()) {
      options.workspace = workspace.path();
    }
    sched = std::make_unique<scheduler::ToolScheduler>(registry, policy, executor, bus,
                                                       std::move(options));
  }

  std::shared_ptr<testing::RecordingTool> add_tool(const std::string &name) {
    auto tool = std::make_shared<testing::RecordingTool>(name);
    registry.register_tool(tool);
    return tool;
  }

  std::vector<scheduler::ToolCall> run(std::vector<scheduler::ToolCallRequest> requests,
                                       drover::common::CancellationToken cancel = {}) {
    auto future = sched->schedule(std::move(requests), std::move(cancel));
    if (future.wait_for(kWait) != std::future_status::ready) {
      throw std::runtime_error("batch did not finish");
    }
    return future.get();
  }

  testing::TempWorkspace workspace;
  drover::tools::ToolRegistry registry;
  testing::FixedPolicy policy;
  scheduler::RegistryToolExecutor executor;
  drover::bus::MessageBus bus;
  std::unique_ptr<scheduler::ToolScheduler> sched;
};

scheduler::ToolCallRequest request(const std::string &name, const std::string &id,
                                   const std::string &args = "{}") {
  return scheduler::request_from_function_call(testing::make_call(name, args, id), "prompt-1");
}

void require_forward_history(const scheduler::ToolCall &call) {
  const auto &history = call.history();
  drover::tests::require(!history.empty() && history.front() == ToolCallState::Validating,
                         "history starts in validating");
  for (std::size_t i = 1; i < history.size(); ++i) {
    drover::tests::require(scheduler::can_transition(history[i - 1], history[i]),
                           "illegal step in history of " + call.request().call_id);
  }
  drover::tests::require(call.terminal(), "call should be terminal");
}

} // namespace

void register_scheduler_tests(std::vector<drover::tests::TestCase> &tests) {
  using drover::tests::require;

  tests.push_back({"scheduler_state_graph_is_forward_only", [] {
                     scheduler::ToolCall call(request("x", "c1"));
                     call.transition(ToolCallState::Scheduled);
                     call.transition(ToolCallState::Executing);
                     bool threw = false;
                     try {
                       call.transition(ToolCallState::Scheduled);
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "backwards transition must throw");
                     call.transition(ToolCallState::Success);
                     require(!scheduler::can_transition(ToolCallState::Success,
                                                        ToolCallState::Error),
                             "terminal states are final");
                     require(!scheduler::can_transition(ToolCallState::Validating,
                                                        ToolCallState::Executing),
                             "executing requires scheduled");
                   }});

  tests.push_back({"scheduler_sequential_batch_runs_in_request_order", [] {
                     Harness h;
                     auto tool = h.add_tool("step");
                     tool->set_delay(std::chrono::milliseconds(20));
                     const auto calls =
                         h.run({request("step", "a"), request("step", "b"), request("step", "c")});
                     require(calls.size() == 3, "three results");
                     const auto executions = tool->executions();
                     require(executions.size() == 3, "three executions");
                     require(executions[0].call_id == "a" && executions[1].call_id == "b" &&
                                 executions[2].call_id == "c",
                             "request order");
                     require(tool->max_concurrent() == 1, "one at a time");
                     require(h.sched->max_concurrent_executing() == 1, "scheduler saw one");
                     for (const auto &call : calls) {
                       require(call.state() == ToolCallState::Success, "all succeed");
                       require_forward_history(call);
                     }
                     require(calls[1].history() ==
                                 std::vector<ToolCallState>{ToolCallState::Validating,
                                                            ToolCallState::Scheduled,
                                                            ToolCallState::Executing,
                                                            ToolCallState::Success},
                             "allowed call path");
                   }});

  tests.push_back({"scheduler_deny_mid_queue_keeps_order_of_the_rest", [] {
                     Harness h;
                     auto tool = h.add_tool("step");
                     auto blocked = h.add_tool("blocked");
                     h.policy.set("blocked", drover::security::PolicyDecision::Deny);
                     const auto calls = h.run(
                         {request("step", "a"), request("blocked", "b"), request("step", "c")});
                     require(calls[1].state() == ToolCallState::Cancelled, "denied call is cancelled");
                     require(calls[1].error() == "Tool execution denied by policy.", calls[1].error());
                     require(blocked->execution_count() == 0, "denied tool never runs");
                     const auto executions = tool->executions();
                     require(executions.size() == 2 && executions[0].call_id == "a" &&
                                 executions[1].call_id == "c",
                             "remaining calls keep order");
                     const auto response = calls[1].to_response();
                     require(response.is_error && response.call_id == "b", "error response");
                     require(response.output == "Tool execution denied by policy.",
                             response.output);
                   }});

  tests.push_back({"scheduler_unknown_tool_suggests_closest_name", [] {
                     Harness h;
                     h.add_tool("read_file");
                     const auto calls = h.run({request("read_fiel", "a")});
                     require(calls[0].state() == ToolCallState::Error, "unknown tool errors");
                     require(calls[0].error().find("not found in registry") != std::string::npos,
                             calls[0].error());
                     require(calls[0].error().find("Did you mean \"read_file\"") != std::string::npos,
                             calls[0].error());
                   }});

  tests.push_back({"scheduler_invalid_arguments_fail_validation", [] {
                     Harness h;
                     auto strict = std::make_shared<testing::RecordingTool>(
                         "strict", drover::tools::ToolKind::Read,
                         R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})");
                     h.registry.register_tool(strict);
                     const auto calls = h.run({request("strict", "a", R"({"path": 4})"),
                                               request("strict", "b", "not json"),
                                               request("strict", "c")});
                     for (const auto &call : calls) {
                       require(call.state() == ToolCallState::Error, "validation fails");
                       require(call.error().rfind("Invalid parameters for strict", 0) == 0,
                               call.error());
                       require(call.history().size() == 2, "validating -> error");
                     }
                     require(strict->execution_count() == 0, "never executed");
                   }});

  tests.push_back({"scheduler_confirmation_proceed_once", [] {
                     std::vector<bool> awaiting;
                     scheduler::SchedulerOptions options;
                     options.on_awaiting_confirmation = [&](bool waiting) {
                       awaiting.push_back(waiting);
                     };
                     Harness h(std::move(options));
                     auto tool = h.add_tool("edit");
                     h.policy.set("edit", drover::security::PolicyDecision::AskUser);
                     std::string details;
                     h.bus.subscribe_requests([&](const drover::bus::ConfirmationRequest &req) {
                       details = req.details;
                       (void)h.bus.respond({.correlation_id = req.correlation_id,
                                            .outcome = drover::bus::ConfirmationOutcome::ProceedOnce,
                                            .edited_args = std::nullopt});
                     });
                     const auto calls = h.run({request("edit", "a", R"({"path":"src/x.cpp"})")});
                     require(calls[0].state() == ToolCallState::Success, "approved call runs");
                     require(details == "edit: src/x.cpp", "details name the target: " + details);
                     require(calls[0].history()[1] == ToolCallState::AwaitingApproval,
                             "went through approval");
                     require(calls[0].outcome() ==
                                 std::optional<drover::bus::ConfirmationOutcome>(
                                     drover::bus::ConfirmationOutcome::ProceedOnce),
                             "outcome recorded");
                     require(awaiting == std::vector<bool>{true, false}, "pause and resume hooks");
                     require(h.bus.pending().empty(), "nothing left pending");
                     require(h.policy.always_allowed().empty(), "once is not remembered");
                   }});

  tests.push_back({"scheduler_confirmation_proceed_always_updates_policy", [] {
                     Harness h;
                     h.add_tool("edit");
                     h.policy.set("edit", drover::security::PolicyDecision::AskUser);
                     std::atomic<int> prompts{0};
                     h.bus.subscribe_requests([&](const drover::bus::ConfirmationRequest &req) {
                       ++prompts;
                       (void)h.bus.respond(
                           {.correlation_id = req.correlation_id,
                            .outcome = drover::bus::ConfirmationOutcome::ProceedAlways,
                            .edited_args = std::nullopt});
                     });
                     const auto calls = h.run({request("edit", "a"), request("edit", "b")});
                     require(calls[0].state() == ToolCallState::Success &&
                                 calls[1].state() == ToolCallState::Success,
                             "both run");
                     require(prompts.load() == 1, "second call is pre-approved");
                     require(h.policy.always_allowed() == std::vector<std::string>{"edit"},
                             "policy remembers");
                   }});

  tests.push_back({"scheduler_confirmation_modify_revalidates_edited_args", [] {
                     Harness h;
                     auto tool = h.add_tool("edit");
                     h.policy.set("edit", drover::security::PolicyDecision::AskUser);
                     h.bus.subscribe_requests([&](const drover::bus::ConfirmationRequest &req) {
                       (void)h.bus.respond(
                           {.correlation_id = req.correlation_id,
                            .outcome = drover::bus::ConfirmationOutcome::ModifyWithEditor,
                            .edited_args = drover::tools::ToolArgs{{"path", "\"safer.txt\""}}});
                     });
                     const auto calls = h.run({request("edit", "a", R"({"path":"risky.txt"})")});
                     require(calls[0].state() == ToolCallState::Success, "edited call runs");
                     require(tool->executions().at(0).args.at("path") == "\"safer.txt\"",
                             "edited args used");
                     require(calls[0].request().args.at("path") == "\"safer.txt\"",
                             "request reflects edit");
                   }});

  tests.push_back({"scheduler_confirmation_cancel_cancels_rest_of_batch", [] {
                     Harness h;
                     auto tool = h.add_tool("edit");
                     auto safe = h.add_tool("look");
                     h.policy.set("edit", drover::security::PolicyDecision::AskUser);
                     h.bus.subscribe_requests([&](const drover::bus::ConfirmationRequest &req) {
                       (void)h.bus.respond({.correlation_id = req.correlation_id,
                                            .outcome = drover::bus::ConfirmationOutcome::Cancel,
                                            .edited_args = std::nullopt});
                     });
                     const auto calls = h.run({request("look", "a"), request("edit", "b"),
                                               request("look", "c")});
                     require(calls[0].state() == ToolCallState::Success, "earlier call kept");
                     require(calls[1].state() == ToolCallState::Cancelled, "declined call");
                     require(calls[2].state() == ToolCallState::Cancelled, "later call dropped");
                     require(calls[2].error() == "User cancelled operation", calls[2].error());
                     require(safe->execution_count() == 1 && tool->execution_count() == 0,
                             "only the first call ran");
                     for (const auto &call : calls) {
                       require_forward_history(call);
                     }
                   }});

  tests.push_back({"scheduler_handle_confirmation_response_directly", [] {
                     Harness h;
                     h.add_tool("edit");
                     h.policy.set("edit", drover::security::PolicyDecision::AskUser);
                     auto future = h.sched->schedule({request("edit", "a")});
                     std::string correlation;
                     const auto deadline = std::chrono::steady_clock::now() + kWait;
                     while (correlation.empty() && std::chrono::steady_clock::now() < deadline) {
                       const auto pending = h.bus.pending();
                       if (!pending.empty()) {
                         correlation = pending.front().correlation_id;
                       } else {
                         std::this_thread::sleep_for(std::chrono::milliseconds(2));
                       }
                     }
                     require(!correlation.empty(), "request should be published");
                     require(!h.sched->handle_confirmation_response({.correlation_id = "bogus"}).ok(),
                             "unknown id rejected");
                     const auto accepted = h.sched->handle_confirmation_response(
                         {.correlation_id = correlation,
                          .outcome = drover::bus::ConfirmationOutcome::ProceedOnce,
                          .edited_args = std::nullopt});
                     require(accepted.ok(), accepted.error());
                     require(future.wait_for(kWait) == std::future_status::ready, "batch ends");
                     require(future.get()[0].state() == ToolCallState::Success, "call ran");
                     require(h.bus.pending().empty(), "request withdrawn from bus");
                   }});

  tests.push_back({"scheduler_cancel_token_interrupts_executing_call", [] {
                     Harness h;
                     auto slow = h.add_tool("slow");
                     slow->set_delay(std::chrono::seconds(5));
                     auto after = h.add_tool("after");
                     drover::common::CancellationSource source;
                     auto future = h.sched->schedule({request("slow", "a"), request("after", "b")},
                                                     source.token());
                     require(slow->wait_started(kWait), "slow call should start");
                     const auto cancelled_at = std::chrono::steady_clock::now();
                     source.cancel("Run cancelled.");
                     require(future.wait_for(kWait) == std::future_status::ready, "batch ends");
                     require(std::chrono::steady_clock::now() - cancelled_at < std::chrono::seconds(2),
                             "cancel is prompt");
                     const auto calls = future.get();
                     require(calls[0].state() == ToolCallState::Cancelled, "executing call cancelled");
                     require(calls[0].history()[calls[0].history().size() - 2] ==
                                 ToolCallState::Executing,
                             "cancelled from executing");
                     require(calls[1].state() == ToolCallState::Cancelled, "queued call cancelled");
                     require(after->execution_count() == 0, "queued call never ran");
                     require(slow->was_cancelled(), "tool observed the cancel");
                     require(calls[0].to_response().output.find("cancelled") != std::string::npos,
                             "response explains the cancel");
                   }});

  tests.push_back({"scheduler_cancel_all_stops_active_batch_only", [] {
                     Harness h;
                     auto slow = h.add_tool("slow");
                     slow->set_delay(std::chrono::seconds(5));
                     auto future = h.sched->schedule({request("slow", "a")});
                     require(slow->wait_started(kWait), "slow call should start");
                     h.sched->cancel_all("stop everything");
                     require(future.wait_for(kWait) == std::future_status::ready, "batch ends");
                     const auto calls = future.get();
                     require(calls[0].state() == ToolCallState::Cancelled, "cancelled");
                     require(calls[0].error().find("stop everything") != std::string::npos,
                             calls[0].error());
                     h.add_tool("quick");
                     const auto later = h.run({request("quick", "b")});
                     require(later[0].state() == ToolCallState::Success,
                             "batches scheduled afterwards still run");
                   }});

  tests.push_back({"scheduler_cancel_while_awaiting_confirmation", [] {
                     Harness h;
                     h.add_tool("edit");
                     h.policy.set("edit", drover::security::PolicyDecision::AskUser);
                     drover::common::CancellationSource source;
                     h.bus.subscribe_requests(
                         [&](const drover::bus::ConfirmationRequest &) { source.cancel("gave up"); });
                     const auto calls = h.run({request("edit", "a")}, source.token());
                     require(calls[0].state() == ToolCallState::Cancelled, "cancelled while waiting");
                     require(calls[0].error() == "gave up", calls[0].error());
                     require(h.bus.pending().empty(), "pending request withdrawn");
                   }});

  tests.push_back({"scheduler_parallel_batches_overlap_but_keep_result_order", [] {
                     scheduler::SchedulerOptions options;
                     options.max_parallel = 3;
                     Harness h(std::move(options));
                     auto tool = h.add_tool("work");
                     tool->set_delay(std::chrono::milliseconds(150));
                     const auto calls = h.run({request("work", "a"), request("work", "b"),
                                               request("work", "c"), request("work", "d")});
                     require(tool->max_concurrent() > 1, "calls should overlap");
                     require(h.sched->max_concurrent_executing() <= 3, "bounded by max_parallel");
                     require(calls[0].request().call_id == "a" && calls[3].request().call_id == "d",
                             "results in request order");
                     for (const auto &call : calls) {
                       require(call.state() == ToolCallState::Success, "all succeed");
                     }
                   }});

  tests.push_back({"scheduler_parallel_workers_do_not_wait_on_a_slow_call", [] {
                     scheduler::SchedulerOptions options;
                     options.max_parallel = 2;
                     Harness h(std::move(options));
                     auto slow = h.add_tool("slow");
                     slow->set_delay(std::chrono::milliseconds(1000));
                     auto fast = h.add_tool("fast");
                     fast->set_delay(std::chrono::milliseconds(100));
                     std::vector<scheduler::ToolCallRequest> requests{request("slow", "s")};
                     for (int i = 0; i < 6; ++i) {
                       requests.push_back(request("fast", "f" + std::to_string(i)));
                     }
                     const auto started = std::chrono::steady_clock::now();
                     const auto calls = h.run(std::move(requests));
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(fast->execution_count() == 6 && slow->execution_count() == 1,
                             "every call ran");
                     require(h.sched->max_concurrent_executing() <= 2, "bounded by max_parallel");
                     require(elapsed < std::chrono::milliseconds(1200),
                             "fast calls drain beside the slow one");
                     require(calls[0].request().call_id == "s" && calls[6].request().call_id == "f5",
                             "results in request order");
                   }});

  tests.push_back({"scheduler_tool_failure_becomes_error_response", [] {
                     Harness h;
                     auto tool = h.add_tool("flaky");
                     tool->set_failure(std::string("disk full"));
                     const auto calls = h.run({request("flaky", "a")});
                     require(calls[0].state() == ToolCallState::Error, "failure is an error");
                     const auto response = calls[0].to_response();
                     require(response.is_error && response.output == "disk full", response.output);
                   }});

  tests.push_back({"scheduler_streams_live_output", [] {
                     std::string seen;
                     std::mutex seen_mutex;
                     scheduler::SchedulerOptions options;
                     options.on_output = [&](const std::string &call_id, std::string_view chunk) {
                       std::lock_guard<std::mutex> lock(seen_mutex);
                       seen += call_id + ":" + std::string(chunk);
                     };
                     Harness h(std::move(options));
                     auto tool = h.add_tool("talk");
                     tool->set_output("hello");
                     (void)h.run({request("talk", "a")});
                     std::lock_guard<std::mutex> lock(seen_mutex);
                     require(seen == "a:hello", "live output routed by call id: " + seen);
                   }});

  tests.push_back({"scheduler_truncates_long_output_and_saves_full_copy", [] {
                     testing::TempWorkspace sink;
                     scheduler::SchedulerOptions options;
                     options.truncation.max_lines = 2;
                     options.truncation.output_dir = sink.path();
                     Harness h(std::move(options));
                     auto tool = h.add_tool("noisy");
                     tool->set_output("l1\nl2\nl3\nl4\n");
                     const auto calls = h.run({request("noisy", "call/1")});
                     require(calls[0].state() == ToolCallState::Success, "still success");
                     const auto &result = *calls[0].result();
                     require(result.truncated, "truncated flag");
                     require(result.output == "l1\nl2\n[output truncated: 6 bytes omitted]",
                             result.output);
                     require(calls[0].output_file().has_value(), "full output saved");
                     const auto saved = drover::common::read_text_file(*calls[0].output_file());
                     require(saved.ok() && saved.value() == "l1\nl2\nl3\nl4\n", "full copy");
                     require(calls[0].output_file()->find("call_1.output") != std::string::npos,
                             "file name sanitized");
                     require(calls[0].to_response().output.find("Full output saved to:") !=
                                 std::string::npos,
                             "response points at the file");
                   }});

  tests.push_back({"scheduler_truncation_respects_utf8_boundaries", [] {
                     scheduler::TruncationOptions options;
                     options.max_bytes = 2;
                     options.max_lines = 0;
                     const auto out = scheduler::truncate_tool_output("c", "a\xc3\xa9z", options);
                     require(out.truncated, "over the byte cap");
                     require(out.text.rfind("a\n[output truncated: 3 bytes omitted]", 0) == 0,
                             "cut before the multibyte char: " + out.text);
                     scheduler::TruncationOptions roomy;
                     const auto kept = scheduler::truncate_tool_output("c", "tiny", roomy);
                     require(!kept.truncated && kept.text == "tiny", "short output untouched");
                   }});

  tests.push_back({"scheduler_bus_outcome_parsing", [] {
                     using drover::bus::ConfirmationOutcome;
                     require(drover::bus::confirmation_outcome_from_string("Y").value() ==
                                 ConfirmationOutcome::ProceedOnce,
                             "y");
                     require(drover::bus::confirmation_outcome_from_string("always").value() ==
                                 ConfirmationOutcome::ProceedAlways,
                             "always");
                     require(drover::bus::confirmation_outcome_from_string("no").value() ==
                                 ConfirmationOutcome::Cancel,
                             "no");
                     require(!drover::bus::confirmation_outcome_from_string("maybe").ok(), "maybe");
                     drover::bus::MessageBus bus;
                     require(!bus.respond({.correlation_id = "nobody"}).ok(),
                             "unknown correlation dropped");
                   }});
}
