#pragma once

#include "drover/common/cancellation.hpp"
#include "drover/common/result.hpp"
#include "drover/providers/content.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace drover::tools {

/// Argument name to raw JSON value (`"text"`, `42`, `true`, `{...}`).
/// Ordered so equal argument sets serialize identically.
using ToolArgs = std::map<std::string, std::string>;

enum class ToolKind { Read, Edit, Execute, Other };

[[nodiscard]] std::string_view tool_kind_name(ToolKind kind);

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  ToolKind kind = ToolKind::Other;
  bool safe = false;

  [[nodiscard]] providers::ToolDeclaration declaration() const;
};

using ToolOutputCallback = std::function<void(std::string_view)>;

struct ToolContext {
  std::filesystem::path workspace_path;
  std::string agent_id;
  std::string call_id;
  common::CancellationToken cancel;
  /// Live output for tools that stream (may be empty).
  ToolOutputCallback on_output;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual ToolKind kind() const = 0;
  [[nodiscard]] virtual bool is_safe() const { return kind() == ToolKind::Read; }
  [[nodiscard]] virtual std::uint32_t timeout_ms() const { return 120'000; }

  [[nodiscard]] ToolSpec spec() const;
};

[[nodiscard]] common::Result<ToolArgs> parse_tool_args(std::string_view json);
[[nodiscard]] std::string serialize_tool_args(const ToolArgs &args);

[[nodiscard]] std::optional<std::string> arg_string(const ToolArgs &args, const std::string &key);
[[nodiscard]] std::optional<std::int64_t> arg_int(const ToolArgs &args, const std::string &key);

/// Resolves `relative` inside `workspace`, refusing paths that escape it.
[[nodiscard]] common::Result<std::filesystem::path>
resolve_in_workspace(const std::filesystem::path &workspace, const std::string &relative);

} // namespace drover::tools
