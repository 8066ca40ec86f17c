#include "drover/tools/builtin/file_write.hpp"

#include "drover/common/fs.hpp"

#include <filesystem>

namespace drover::tools {

std::string_view WriteFileTool::name() const { return "write_file"; }

std::string_view WriteFileTool::description() const {
  return "Create or overwrite a file in the workspace with the given content";
}

std::string WriteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string"},"content":{"type":"string"}}})";
}

common::Result<ToolResult> WriteFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto path = arg_string(args, "path");
  const auto content = arg_string(args, "content");
  if (!path.has_value()) {
    return common::Result<ToolResult>::failure("Missing argument: path");
  }
  if (!content.has_value()) {
    return common::Result<ToolResult>::failure("Missing argument: content");
  }
  auto resolved = resolve_in_workspace(ctx.workspace_path, *path);
  if (!resolved.ok()) {
    return common::Result<ToolResult>::failure(resolved.error());
  }

  const bool existed = std::filesystem::exists(resolved.value());
  // Write beside the target and rename so readers never see a partial file.
  const auto temp_path = std::filesystem::path(resolved.value().string() + ".drover-tmp");
  auto written = common::write_text_file(temp_path, *content);
  if (!written.ok()) {
    return common::Result<ToolResult>::failure(written.error());
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, resolved.value(), ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return common::Result<ToolResult>::failure("Failed to replace " + *path);
  }

  ToolResult result;
  result.output = std::string(existed ? "Overwrote " : "Created ") + *path + " (" +
                  std::to_string(content->size()) + " bytes)";
  result.metadata["path"] = resolved.value().string();
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace drover::tools
