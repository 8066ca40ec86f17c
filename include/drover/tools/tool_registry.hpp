#pragma once

#include "drover/providers/content.hpp"
#include "drover/tools/tool.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace drover::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::shared_ptr<ITool> tool);

  /// Case-insensitive lookup; nullptr when unknown.
  [[nodiscard]] ITool *lookup(std::string_view name) const;
  [[nodiscard]] std::shared_ptr<ITool> lookup_shared(std::string_view name) const;

  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::vector<providers::ToolDeclaration> list_declarations() const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

  /// Closest registered name by edit distance, if it is plausibly a typo.
  [[nodiscard]] std::optional<std::string> suggest(std::string_view name) const;

  /// Registry sharing only the named tools; unknown names are skipped.
  [[nodiscard]] ToolRegistry subset(const std::vector<std::string> &names) const;

private:
  std::vector<std::shared_ptr<ITool>> tools_;
  std::unordered_map<std::string, std::shared_ptr<ITool>> by_name_;
};

[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

} // namespace drover::tools
