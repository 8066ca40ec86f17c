#pragma once

#include "drover/common/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drover::agent {

inline constexpr std::string_view kGeneralistAgentName = "generalist";

struct AgentDefinition {
  std::string name;
  std::string description;
  std::string system_prompt;
  /// Tool names the agent may call; empty means every registered tool.
  std::vector<std::string> tools;
  std::optional<std::uint32_t> max_turns;
  std::optional<std::uint64_t> timeout_ms;
  std::optional<double> temperature;
};

[[nodiscard]] AgentDefinition generalist_definition();

/// Named agent definitions. The generalist is always present.
class AgentRegistry {
public:
  AgentRegistry();

  /// Adds or replaces a definition. Names are case-insensitive.
  [[nodiscard]] common::Status register_definition(AgentDefinition definition);

  [[nodiscard]] const AgentDefinition *find(const std::string &name) const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const { return definitions_.size(); }

  /// One line per agent, for the delegate tool's description.
  [[nodiscard]] std::string describe() const;

private:
  std::map<std::string, AgentDefinition> definitions_;
};

} // namespace drover::agent
