#pragma once

#include "drover/tools/tool.hpp"

#include <cstddef>

namespace drover::tools {

/// Runs a command through /bin/sh in the workspace, killing it on timeout or cancellation.
class ShellTool final : public ITool {
public:
  explicit ShellTool(std::uint32_t timeout_ms = 120'000, std::size_t max_output_bytes = 8 * 1024 * 1024);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] ToolKind kind() const override { return ToolKind::Execute; }
  [[nodiscard]] std::uint32_t timeout_ms() const override { return timeout_ms_; }

private:
  std::uint32_t timeout_ms_;
  std::size_t max_output_bytes_;
};

} // namespace drover::tools
