#pragma once

#include "drover/common/result.hpp"
#include "drover/config/schema.hpp"
#include "drover/tools/tool.hpp"
#include "drover/tools/tool_registry.hpp"

#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace drover::security {

enum class PolicyDecision { Allow, Deny, AskUser };
enum class ApprovalMode { Default, AutoEdit, Yolo };

[[nodiscard]] std::string_view policy_decision_name(PolicyDecision decision);
[[nodiscard]] std::string approval_mode_to_string(ApprovalMode mode);
[[nodiscard]] common::Result<ApprovalMode> approval_mode_from_string(const std::string &value);

/// Gate consulted before every tool call executes.
class IPolicyDecisionProvider {
public:
  virtual ~IPolicyDecisionProvider() = default;

  [[nodiscard]] virtual PolicyDecision decide(const std::string &tool_name,
                                              const tools::ToolArgs &args) = 0;
  /// Remembers a "proceed always" answer for the rest of the session.
  virtual void allow_always(const std::string &tool_name) { (void)tool_name; }
};

/// Rule patterns are `tool` or `tool(argument-glob)`; the glob is matched against the
/// tool's primary argument (`command` for shells, otherwise `path`).
struct PolicyRules {
  std::vector<std::string> allow;
  std::vector<std::string> deny;
  std::vector<std::string> ask;
  ApprovalMode mode = ApprovalMode::Default;
  bool interactive = true;
};

[[nodiscard]] common::Result<PolicyRules> rules_from_config(const config::SecurityConfig &config);

class PolicyEngine final : public IPolicyDecisionProvider {
public:
  PolicyEngine(PolicyRules rules, const tools::ToolRegistry &registry);

  [[nodiscard]] PolicyDecision decide(const std::string &tool_name,
                                      const tools::ToolArgs &args) override;
  void allow_always(const std::string &tool_name) override;

  void set_mode(ApprovalMode mode);
  [[nodiscard]] ApprovalMode mode() const;
  [[nodiscard]] bool interactive() const { return rules_.interactive; }

  [[nodiscard]] static bool matches_rule(std::string_view rule, const std::string &tool_name,
                                         const tools::ToolArgs &args);

private:
  [[nodiscard]] static bool matches_any(const std::vector<std::string> &rules,
                                        const std::string &tool_name, const tools::ToolArgs &args);
  [[nodiscard]] PolicyDecision ask_or_deny() const;

  PolicyRules rules_;
  const tools::ToolRegistry &registry_;
  mutable std::mutex mutex_;
  std::set<std::string> always_allowed_;
};

} // namespace drover::security
