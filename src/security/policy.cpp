#include "drover/security/policy.hpp"

#include "drover/common/fs.hpp"

namespace drover::security {

namespace {

std::string primary_argument(const tools::ToolArgs &args) {
  for (const char *key : {"command", "path", "file_path", "url"}) {
    if (auto value = tools::arg_string(args, key); value.has_value()) {
      return *value;
    }
  }
  return "";
}

} // namespace

std::string_view policy_decision_name(const PolicyDecision decision) {
  switch (decision) {
  case PolicyDecision::Allow:
    return "allow";
  case PolicyDecision::Deny:
    return "deny";
  case PolicyDecision::AskUser:
    return "ask_user";
  }
  return "deny";
}

std::string approval_mode_to_string(const ApprovalMode mode) {
  switch (mode) {
  case ApprovalMode::Default:
    return "default";
  case ApprovalMode::AutoEdit:
    return "auto_edit";
  case ApprovalMode::Yolo:
    return "yolo";
  }
  return "default";
}

common::Result<ApprovalMode> approval_mode_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "default") {
    return common::Result<ApprovalMode>::success(ApprovalMode::Default);
  }
  if (normalized == "auto_edit" || normalized == "auto-edit") {
    return common::Result<ApprovalMode>::success(ApprovalMode::AutoEdit);
  }
  if (normalized == "yolo") {
    return common::Result<ApprovalMode>::success(ApprovalMode::Yolo);
  }
  return common::Result<ApprovalMode>::failure("unknown approval mode: " + value);
}

common::Result<PolicyRules> rules_from_config(const config::SecurityConfig &config) {
  auto mode = approval_mode_from_string(config.approval_mode);
  if (!mode.ok()) {
    return common::Result<PolicyRules>::failure(mode.error());
  }
  return common::Result<PolicyRules>::success(PolicyRules{.allow = config.allow,
                                                          .deny = config.deny,
                                                          .ask = config.ask,
                                                          .mode = mode.value(),
                                                          .interactive = config.interactive});
}

PolicyEngine::PolicyEngine(PolicyRules rules, const tools::ToolRegistry &registry)
    : rules_(std::move(rules)), registry_(registry) {}

bool PolicyEngine::matches_rule(std::string_view rule, const std::string &tool_name,
                                const tools::ToolArgs &args) {
  const std::string trimmed = common::trim(rule);
  const auto open = trimmed.find('(');
  if (open == std::string::npos || trimmed.back() != ')') {
    return common::glob_match(trimmed, tool_name);
  }
  const std::string name_pattern = common::trim(trimmed.substr(0, open));
  const std::string arg_pattern = trimmed.substr(open + 1, trimmed.size() - open - 2);
  return common::glob_match(name_pattern, tool_name) &&
         common::glob_match(arg_pattern, primary_argument(args));
}

bool PolicyEngine::matches_any(const std::vector<std::string> &rules, const std::string &tool_name,
                               const tools::ToolArgs &args) {
  for (const auto &rule : rules) {
    if (matches_rule(rule, tool_name, args)) {
      return true;
    }
  }
  return false;
}

PolicyDecision PolicyEngine::ask_or_deny() const {
  return rules_.interactive ? PolicyDecision::AskUser : PolicyDecision::Deny;
}

PolicyDecision PolicyEngine::decide(const std::string &tool_name, const tools::ToolArgs &args) {
  if (matches_any(rules_.deny, tool_name, args)) {
    return PolicyDecision::Deny;
  }
  if (matches_any(rules_.allow, tool_name, args)) {
    return PolicyDecision::Allow;
  }
  if (matches_any(rules_.ask, tool_name, args)) {
    return ask_or_deny();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (always_allowed_.contains(common::to_lower(tool_name))) {
    return PolicyDecision::Allow;
  }

  const tools::ITool *tool = registry_.lookup(tool_name);
  switch (rules_.mode) {
  case ApprovalMode::Yolo:
    return PolicyDecision::Allow;
  case ApprovalMode::AutoEdit:
    if (tool != nullptr && (tool->kind() == tools::ToolKind::Read ||
                            tool->kind() == tools::ToolKind::Edit || tool->is_safe())) {
      return PolicyDecision::Allow;
    }
    return ask_or_deny();
  case ApprovalMode::Default:
    break;
  }
  if (tool != nullptr && tool->is_safe()) {
    return PolicyDecision::Allow;
  }
  return ask_or_deny();
}

void PolicyEngine::allow_always(const std::string &tool_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  always_allowed_.insert(common::to_lower(tool_name));
}

void PolicyEngine::set_mode(const ApprovalMode mode) {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.mode = mode;
}

ApprovalMode PolicyEngine::mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_.mode;
}

} // namespace drover::security
