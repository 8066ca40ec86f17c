#pragma once

#include "drover/config/schema.hpp"
#include "drover/tools/tool_registry.hpp"

namespace drover::tools {

/// Shell, file read, file write and complete_task.
void register_builtin_tools(ToolRegistry &registry, const config::Config &config);

} // namespace drover::tools
