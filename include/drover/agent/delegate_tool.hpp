#pragma once

#include "drover/agent/agent_registry.hpp"
#include "drover/agent/orchestrator.hpp"
#include "drover/tools/tool.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace drover::agent {

inline constexpr std::string_view kDelegateToolName = "delegate_to_agent";

using SubagentRunner = std::function<RunResult(
    const AgentDefinition &definition, const std::string &task,
    const common::CancellationToken &cancel)>;

/// Hands a task to a registered agent, which runs autonomously until it calls
/// complete_task or hits a limit.
class DelegateToAgentTool final : public tools::ITool {
public:
  DelegateToAgentTool(const AgentRegistry &agents, SubagentRunner runner);

  [[nodiscard]] std::string_view name() const override { return kDelegateToolName; }
  [[nodiscard]] std::string_view description() const override { return description_; }
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;
  [[nodiscard]] tools::ToolKind kind() const override { return tools::ToolKind::Other; }
  [[nodiscard]] std::uint32_t timeout_ms() const override { return 0; }

private:
  const AgentRegistry &agents_;
  SubagentRunner runner_;
  std::string description_;
};

/// Runner that builds a fresh orchestrator per delegation. Sub-agents never see the
/// delegate tool themselves.
[[nodiscard]] SubagentRunner make_subagent_runner(OrchestratorDeps deps, config::Config config,
                                                  std::filesystem::path workspace);

} // namespace drover::agent
