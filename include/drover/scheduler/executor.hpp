#pragma once

#include "drover/common/result.hpp"
#include "drover/tools/tool_registry.hpp"

#include <string>

namespace drover::scheduler {

/// Runs a validated, approved tool call. Implementations may run locally, in a
/// sandbox, or remotely.
class IToolExecutor {
public:
  virtual ~IToolExecutor() = default;

  [[nodiscard]] virtual common::Result<tools::ToolResult>
  execute(const std::string &tool_name, const tools::ToolArgs &args,
          const tools::ToolContext &ctx) = 0;
};

class RegistryToolExecutor final : public IToolExecutor {
public:
  explicit RegistryToolExecutor(const tools::ToolRegistry &registry);

  [[nodiscard]] common::Result<tools::ToolResult> execute(const std::string &tool_name,
                                                          const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;

private:
  const tools::ToolRegistry &registry_;
};

} // namespace drover::scheduler
