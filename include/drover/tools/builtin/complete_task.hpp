#pragma once

#include "drover/tools/tool.hpp"

namespace drover::tools {

inline constexpr std::string_view kCompleteTaskToolName = "complete_task";

/// Completion signal for autonomous agents. The orchestrator intercepts calls to it;
/// execute() only exists so the declaration can live in a registry.
class CompleteTaskTool final : public ITool {
public:
  [[nodiscard]] std::string_view name() const override { return kCompleteTaskToolName; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] ToolKind kind() const override { return ToolKind::Other; }
  [[nodiscard]] bool is_safe() const override { return true; }
};

} // namespace drover::tools
