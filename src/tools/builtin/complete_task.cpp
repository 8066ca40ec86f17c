#include "drover/tools/builtin/complete_task.hpp"

namespace drover::tools {

std::string_view CompleteTaskTool::description() const {
  return "Call this tool to submit your final answer and finish the task. This is the ONLY way "
         "to complete the task.";
}

std::string CompleteTaskTool::parameters_schema() const {
  return R"({"type":"object","required":["result"],"properties":{"result":{"type":"string","description":"Your final result or summary of the work done."}}})";
}

common::Result<ToolResult> CompleteTaskTool::execute(const ToolArgs &args, const ToolContext &) {
  auto result = arg_string(args, "result");
  if (!result.has_value()) {
    return common::Result<ToolResult>::failure("Missing required \"result\" argument");
  }
  ToolResult out;
  out.output = *result;
  return common::Result<ToolResult>::success(std::move(out));
}

} // namespace drover::tools
