#include "drover/tools/builtin/file_read.hpp"

#include "drover/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace drover::tools {

namespace {

constexpr std::int64_t kDefaultLineLimit = 2000;

bool looks_binary(const std::string &content) {
  const std::size_t probe = std::min<std::size_t>(content.size(), 8192);
  return content.find('\0', 0) < probe;
}

} // namespace

std::string_view ReadFileTool::name() const { return "read_file"; }

std::string_view ReadFileTool::description() const {
  return "Read a text file from the workspace. Use offset and limit (in lines) to page through "
         "large files.";
}

std::string ReadFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"},"offset":{"type":"integer","description":"0-based first line"},"limit":{"type":"integer","description":"Maximum number of lines"}}})";
}

common::Result<ToolResult> ReadFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto path = arg_string(args, "path");
  if (!path.has_value()) {
    return common::Result<ToolResult>::failure("Missing argument: path");
  }
  auto resolved = resolve_in_workspace(ctx.workspace_path, *path);
  if (!resolved.ok()) {
    return common::Result<ToolResult>::failure(resolved.error());
  }
  auto content = common::read_text_file(resolved.value());
  if (!content.ok()) {
    return common::Result<ToolResult>::failure(content.error());
  }
  if (looks_binary(content.value())) {
    return common::Result<ToolResult>::failure("Cannot display binary file: " + *path);
  }

  const std::int64_t offset = std::max<std::int64_t>(0, arg_int(args, "offset").value_or(0));
  const std::int64_t limit =
      std::max<std::int64_t>(1, arg_int(args, "limit").value_or(kDefaultLineLimit));

  std::istringstream stream(content.value());
  std::string line;
  std::string output;
  std::int64_t index = 0;
  std::int64_t emitted = 0;
  bool more = false;
  while (std::getline(stream, line)) {
    if (index++ < offset) {
      continue;
    }
    if (emitted == limit) {
      more = true;
      break;
    }
    output += line;
    output.push_back('\n');
    ++emitted;
  }

  ToolResult result;
  result.truncated = more;
  if (more) {
    output += "[showing lines " + std::to_string(offset + 1) + "-" +
              std::to_string(offset + emitted) + "; use offset to read more]\n";
  }
  result.output = std::move(output);
  result.metadata["lines"] = std::to_string(emitted);
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace drover::tools
