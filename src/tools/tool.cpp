#include "drover/tools/tool.hpp"

#include "drover/common/json_util.hpp"

#include <cmath>

namespace drover::tools {

std::string_view tool_kind_name(const ToolKind kind) {
  switch (kind) {
  case ToolKind::Read:
    return "read";
  case ToolKind::Edit:
    return "edit";
  case ToolKind::Execute:
    return "execute";
  case ToolKind::Other:
    return "other";
  }
  return "other";
}

providers::ToolDeclaration ToolSpec::declaration() const {
  return providers::ToolDeclaration{
      .name = name, .description = description, .parameters_json = parameters_json};
}

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .kind = kind(),
                  .safe = is_safe()};
}

common::Result<ToolArgs> parse_tool_args(std::string_view json) {
  if (json.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    return common::Result<ToolArgs>::success({});
  }
  auto fields = common::json_object_fields(json);
  if (!fields.has_value()) {
    return common::Result<ToolArgs>::failure("Tool arguments are not a JSON object");
  }
  ToolArgs args;
  for (auto &[key, raw] : *fields) {
    args[key] = std::move(raw);
  }
  return common::Result<ToolArgs>::success(std::move(args));
}

std::string serialize_tool_args(const ToolArgs &args) { return common::json_object_from_raw(args); }

std::optional<std::string> arg_string(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  return common::json_as_string(it->second);
}

std::optional<std::int64_t> arg_int(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  const auto number = common::json_as_number(it->second);
  if (!number.has_value() || std::floor(*number) != *number) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(*number);
}

common::Result<std::filesystem::path> resolve_in_workspace(const std::filesystem::path &workspace,
                                                           const std::string &relative) {
  using PathResult = common::Result<std::filesystem::path>;
  if (relative.empty()) {
    return PathResult::failure("Path must not be empty");
  }
  std::error_code ec;
  const auto root = std::filesystem::weakly_canonical(
      workspace.empty() ? std::filesystem::current_path(ec) : workspace, ec);
  if (ec) {
    return PathResult::failure("Invalid workspace: " + ec.message());
  }

  std::filesystem::path candidate(relative);
  if (candidate.is_relative()) {
    candidate = root / candidate;
  }
  const auto resolved = std::filesystem::weakly_canonical(candidate, ec);
  if (ec) {
    return PathResult::failure("Invalid path '" + relative + "': " + ec.message());
  }

  auto r = resolved.begin();
  for (auto w = root.begin(); w != root.end(); ++w, ++r) {
    if (r == resolved.end() || *r != *w) {
      return PathResult::failure("Path escapes the workspace: " + relative);
    }
  }
  return PathResult::success(resolved);
}

} // namespace drover::tools
