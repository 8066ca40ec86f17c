#include "drover/tools/builtin/builtins.hpp"

#include "drover/tools/builtin/complete_task.hpp"
#include "drover/tools/builtin/file_read.hpp"
#include "drover/tools/builtin/file_write.hpp"
#include "drover/tools/builtin/shell.hpp"

namespace drover::tools {

void register_builtin_tools(ToolRegistry &registry, const config::Config &config) {
  // Capture more than the scheduler keeps so the full output can be persisted.
  const auto capture = static_cast<std::size_t>(config.scheduler.truncate_output_bytes) * 8;
  registry.register_tool(std::make_shared<ShellTool>(120'000, capture));
  registry.register_tool(std::make_shared<ReadFileTool>());
  registry.register_tool(std::make_shared<WriteFileTool>());
  registry.register_tool(std::make_shared<CompleteTaskTool>());
}

} // namespace drover::tools
