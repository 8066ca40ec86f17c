#include "drover/agent/delegate_tool.hpp"

#include "drover/common/json_util.hpp"
#include "drover/observability/global.hpp"

#include <sstream>

namespace drover::agent {

DelegateToAgentTool::DelegateToAgentTool(const AgentRegistry &agents, SubagentRunner runner)
    : agents_(agents), runner_(std::move(runner)) {
  description_ = "Delegates a self-contained task to a specialized agent and returns its final "
                 "answer. Available agents:\n" +
                 agents_.describe();
}

std::string DelegateToAgentTool::parameters_schema() const {
  std::ostringstream names;
  bool first = true;
  for (const auto &name : agents_.names()) {
    names << (first ? "" : ",") << common::json_quote(name);
    first = false;
  }
  return R"({"type":"object","required":["agent_name","task"],"properties":{"agent_name":{"type":"string","enum":[)" +
         names.str() +
         R"(]},"task":{"type":"string","description":"Complete description of the task, including any context the agent needs."}}})";
}

common::Result<tools::ToolResult> DelegateToAgentTool::execute(const tools::ToolArgs &args,
                                                               const tools::ToolContext &ctx) {
  const auto agent_name = tools::arg_string(args, "agent_name");
  const auto task = tools::arg_string(args, "task");
  if (!agent_name.has_value() || !task.has_value()) {
    return common::Result<tools::ToolResult>::failure(
        "delegate_to_agent requires \"agent_name\" and \"task\"");
  }
  const auto *definition = agents_.find(*agent_name);
  if (definition == nullptr) {
    return common::Result<tools::ToolResult>::failure("Unknown agent: " + *agent_name);
  }

  observability::log_info("delegate", ctx.agent_id + " delegating to " + definition->name);
  const auto run = runner_(*definition, *task, ctx.cancel);

  tools::ToolResult result;
  result.metadata["agent_id"] = run.summary.agent_id;
  result.metadata["termination"] = std::string(termination_mode_name(run.mode));
  result.metadata["turns"] = std::to_string(run.summary.turns);
  result.metadata["tool_calls"] = std::to_string(run.summary.tool_calls);
  if (run.mode == TerminationMode::Goal) {
    result.output = run.output;
    return common::Result<tools::ToolResult>::success(std::move(result));
  }
  result.success = false;
  result.output = "Agent '" + definition->name + "' ended with " +
                  std::string(termination_mode_name(run.mode)) + ": " + run.reason;
  return common::Result<tools::ToolResult>::success(std::move(result));
}

SubagentRunner make_subagent_runner(OrchestratorDeps deps, config::Config config,
                                    std::filesystem::path workspace) {
  return [deps, config = std::move(config), workspace = std::move(workspace)](
             const AgentDefinition &definition, const std::string &task,
             const common::CancellationToken &cancel) {
    std::vector<std::string> names;
    for (const auto &name : deps.registry.names()) {
      if (name != kDelegateToolName) {
        names.push_back(name);
      }
    }
    const tools::ToolRegistry visible = deps.registry.subset(names);
    OrchestratorDeps sub_deps{.generator = deps.generator,
                              .registry = visible,
                              .policy = deps.policy,
                              .executor = deps.executor,
                              .bus = deps.bus,
                              .embedding_cache = deps.embedding_cache};
    AgentRunOrchestrator orchestrator(sub_deps, definition, config, workspace);
    RunOptions options;
    options.cancel = cancel;
    return orchestrator.run(task, options);
  };
}

} // namespace drover::agent
