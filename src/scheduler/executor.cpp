#include "drover/scheduler/executor.hpp"

#include <exception>

namespace drover::scheduler {

RegistryToolExecutor::RegistryToolExecutor(const tools::ToolRegistry &registry)
    : registry_(registry) {}

common::Result<tools::ToolResult> RegistryToolExecutor::execute(const std::string &tool_name,
                                                                const tools::ToolArgs &args,
                                                                const tools::ToolContext &ctx) {
  auto tool = registry_.lookup_shared(tool_name);
  if (tool == nullptr) {
    return common::Result<tools::ToolResult>::failure("Unknown tool: " + tool_name);
  }
  try {
    return tool->execute(args, ctx);
  } catch (const std::exception &ex) {
    return common::Result<tools::ToolResult>::failure(tool_name + " failed: " + ex.what());
  }
}

} // namespace drover::scheduler
