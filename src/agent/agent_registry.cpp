#include "drover/agent/agent_registry.hpp"

#include "drover/common/fs.hpp"

#include <sstream>

namespace drover::agent {

namespace {

constexpr std::string_view kGeneralistPrompt =
    "You are a general-purpose software engineering agent working inside the user's "
    "workspace. Use the available tools to inspect files, run commands and make changes. "
    "Work step by step, verify your changes, and keep tool calls focused. When the task is "
    "finished, call `complete_task` with a concise summary of what you did.";

} // namespace

AgentDefinition generalist_definition() {
  AgentDefinition definition;
  definition.name = std::string(kGeneralistAgentName);
  definition.description = "General-purpose agent for multi-step coding tasks.";
  definition.system_prompt = std::string(kGeneralistPrompt);
  return definition;
}

AgentRegistry::AgentRegistry() {
  auto definition = generalist_definition();
  definitions_.emplace(definition.name, std::move(definition));
}

common::Status AgentRegistry::register_definition(AgentDefinition definition) {
  definition.name = common::trim(definition.name);
  if (definition.name.empty()) {
    return common::Status::error("agent definition requires a name");
  }
  if (common::trim(definition.system_prompt).empty()) {
    return common::Status::error("agent '" + definition.name + "' has no system prompt");
  }
  if (definition.max_turns.has_value() && *definition.max_turns == 0) {
    return common::Status::error("agent '" + definition.name + "' max_turns must be positive");
  }
  const std::string key = common::to_lower(definition.name);
  definitions_[key] = std::move(definition);
  return common::Status::success();
}

const AgentDefinition *AgentRegistry::find(const std::string &name) const {
  const auto it = definitions_.find(common::to_lower(common::trim(name)));
  return it == definitions_.end() ? nullptr : &it->second;
}

std::vector<std::string> AgentRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(definitions_.size());
  for (const auto &[key, definition] : definitions_) {
    out.push_back(definition.name);
  }
  return out;
}

std::string AgentRegistry::describe() const {
  std::ostringstream out;
  for (const auto &[key, definition] : definitions_) {
    out << "- " << definition.name << ": " << definition.description << "\n";
  }
  return out.str();
}

} // namespace drover::agent
