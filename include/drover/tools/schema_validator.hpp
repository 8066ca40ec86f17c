#pragma once

#include "drover/common/result.hpp"
#include "drover/tools/tool.hpp"

#include <string_view>

namespace drover::tools {

/// Checks `args` against the subset of JSON Schema tool declarations use:
/// `required`, per-property `type` and `enum`, and `additionalProperties: false`.
[[nodiscard]] common::Status validate_args(const ToolArgs &args, std::string_view schema_json);

} // namespace drover::tools
