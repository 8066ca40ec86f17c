#pragma once

#include "drover/tools/tool.hpp"

namespace drover::tools {

class WriteFileTool final : public ITool {
public:
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] ToolKind kind() const override { return ToolKind::Edit; }
};

} // namespace drover::tools
