#include "drover/tools/tool_registry.hpp"

#include "drover/common/fs.hpp"

#include <algorithm>
#include <limits>

namespace drover::tools {

std::size_t edit_distance(std::string_view a, std::string_view b) {
  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    previous[j] = j;
  }
  for (std::size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

void ToolRegistry::register_tool(std::shared_ptr<ITool> tool) {
  if (!tool) {
    return;
  }
  const std::string key = common::to_lower(std::string(tool->name()));
  if (auto existing = by_name_.find(key); existing != by_name_.end()) {
    std::erase(tools_, existing->second);
  }
  by_name_[key] = tool;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::lookup(const std::string_view name) const {
  return lookup_shared(name).get();
}

std::shared_ptr<ITool> ToolRegistry::lookup_shared(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<providers::ToolDeclaration> ToolRegistry::list_declarations() const {
  std::vector<providers::ToolDeclaration> declarations;
  declarations.reserve(tools_.size());
  for (const auto &tool : tools_) {
    declarations.push_back(tool->spec().declaration());
  }
  return declarations;
}

std::vector<std::string> ToolRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.emplace_back(tool->name());
  }
  return out;
}

std::optional<std::string> ToolRegistry::suggest(const std::string_view name) const {
  const std::string wanted = common::to_lower(std::string(name));
  std::optional<std::string> best;
  std::size_t best_distance = std::numeric_limits<std::size_t>::max();
  for (const auto &tool : tools_) {
    const std::string candidate(tool->name());
    const std::size_t distance = edit_distance(wanted, common::to_lower(candidate));
    if (distance < best_distance) {
      best_distance = distance;
      best = candidate;
    }
  }
  const std::size_t limit = std::max<std::size_t>(2, wanted.size() / 2);
  if (!best.has_value() || best_distance > limit) {
    return std::nullopt;
  }
  return best;
}

ToolRegistry ToolRegistry::subset(const std::vector<std::string> &names) const {
  ToolRegistry out;
  for (const auto &name : names) {
    if (auto tool = lookup_shared(name)) {
      out.register_tool(std::move(tool));
    }
  }
  return out;
}

} // namespace drover::tools
