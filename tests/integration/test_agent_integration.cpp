#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "drover/agent/orchestrator.hpp"
#include "drover/bus/message_bus.hpp"
#include "drover/common/json_util.hpp"
#include "drover/scheduler/executor.hpp"
#include "drover/security/policy.hpp"
#include "drover/tools/builtin/builtins.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace {

namespace agent = drover::agent;
namespace testing = drover::testing;
using drover::common::json_quote;

std::string read_all(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

/// Builtin tools behind the real policy engine.
struct Stack {
  explicit Stack(drover::config::Config cfg, drover::security::PolicyRules rules)
      : config(std::move(cfg)) {
    drover::tools::register_builtin_tools(registry, config);
    policy = std::make_unique<drover::security::PolicyEngine>(std::move(rules), registry);
  }

  std::unique_ptr<agent::AgentRunOrchestrator> make() {
    agent::OrchestratorDeps deps{.generator = generator,
                                 .registry = registry,
                                 .policy = *policy,
                                 .executor = executor,
                                 .bus = bus,
                                 .embedding_cache = nullptr};
    return std::make_unique<agent::AgentRunOrchestrator>(deps, agent::generalist_definition(),
                                                         config, workspace.path());
  }

  testing::TempWorkspace workspace;
  drover::config::Config config;
  testing::ScriptedGenerator generator;
  drover::tools::ToolRegistry registry;
  std::unique_ptr<drover::security::PolicyEngine> policy;
  drover::scheduler::RegistryToolExecutor executor{registry};
  drover::bus::MessageBus bus;
};

drover::security::PolicyRules yolo() {
  drover::security::PolicyRules rules;
  rules.mode = drover::security::ApprovalMode::Yolo;
  rules.interactive = false;
  return rules;
}

} // namespace

void register_agent_integration_tests(std::vector<drover::tests::TestCase> &tests) {
  using drover::tests::require;

  tests.push_back({"integration_write_run_read_then_complete", [] {
                     Stack stack(testing::test_config(), yolo());
                     stack.generator.push(testing::calls_reply({testing::make_call(
                         "write_file",
                         R"({"path":"notes/todo.txt","content":"ship the parser\n"})", "w1")}));
                     stack.generator.push(testing::calls_reply({testing::make_call(
                         "run_shell_command",
                         "{\"command\":" + json_quote("wc -l < notes/todo.txt") + "}", "s1")}));
                     stack.generator.push(testing::calls_reply(
                         {testing::make_call("read_file", R"({"path":"notes/todo.txt"})", "r1")}));
                     stack.generator.push(testing::calls_reply({testing::make_call(
                         "complete_task", R"({"result":"Wrote and verified notes/todo.txt"})")}));

                     auto orchestrator = stack.make();
                     const auto result = orchestrator->run("Create a todo file");
                     require(result.mode == agent::TerminationMode::Goal, result.reason);
                     require(result.output == "Wrote and verified notes/todo.txt", result.output);
                     require(result.summary.tool_calls == 3, "three tools ran");
                     require(read_all(stack.workspace.path() / "notes" / "todo.txt") ==
                                 "ship the parser\n",
                             "file written in the workspace");

                     const auto requests = stack.generator.requests();
                     require(requests.size() == 4, "four model turns");
                     const auto &shell = requests[2].messages.back();
                     require(shell.is_function_response() &&
                                 shell.function_response->output.find('1') != std::string::npos,
                             "shell output returned");
                     const auto &read = requests[3].messages.back();
                     require(read.is_function_response() &&
                                 read.function_response->output.find("ship the parser") !=
                                     std::string::npos,
                             "file content returned");
                   }});

  tests.push_back({"integration_non_interactive_policy_denies_edits", [] {
                     drover::security::PolicyRules rules;
                     rules.interactive = false;
                     Stack stack(testing::test_config(), rules);
                     stack.generator.push(testing::calls_reply({testing::make_call(
                         "write_file", R"({"path":"x.txt","content":"x"})", "w1")}));
                     stack.generator.push(testing::calls_reply(
                         {testing::make_call("complete_task", R"({"result":"Could not write"})")}));

                     auto orchestrator = stack.make();
                     const auto result = orchestrator->run("Write x");
                     require(result.mode == agent::TerminationMode::Goal, result.reason);
                     require(!std::filesystem::exists(stack.workspace.path() / "x.txt"),
                             "nothing written");
                     const auto denied = stack.generator.requests()[1].messages.back();
                     require(denied.is_function_response() && denied.function_response->is_error,
                             "denial reported as an error");
                     require(denied.function_response->output.find("denied by policy") !=
                                 std::string::npos,
                             denied.function_response->output);
                     require(result.summary.tool_calls == 0, "denied calls never execute");
                   }});

  tests.push_back({"integration_confirmation_time_is_not_charged", [] {
                     auto config = testing::test_config();
                     config.security.interactive = true;
                     config.agent.timeout_ms = 300;
                     drover::security::PolicyRules rules;
                     Stack stack(config, rules);
                     const auto subscription = stack.bus.subscribe_requests(
                         [&stack](const drover::bus::ConfirmationRequest &request) {
                           std::this_thread::sleep_for(std::chrono::milliseconds(600));
                           (void)stack.bus.respond(
                               {.correlation_id = request.correlation_id,
                                .outcome = drover::bus::ConfirmationOutcome::ProceedOnce,
                                .edited_args = std::nullopt});
                         });
                     stack.generator.push(testing::calls_reply({testing::make_call(
                         "write_file", R"({"path":"slow.txt","content":"approved"})", "w1")}));
                     stack.generator.push(testing::text_reply("Written after approval."));

                     auto orchestrator = stack.make();
                     agent::RunOptions options;
                     options.interactive = true;
                     const auto result = orchestrator->run("Write slow.txt", options);
                     stack.bus.unsubscribe(subscription);
                     require(result.mode == agent::TerminationMode::Goal, result.reason);
                     require(result.output == "Written after approval.", result.output);
                     require(read_all(stack.workspace.path() / "slow.txt") == "approved",
                             "approved write happened");
                   }});
}
