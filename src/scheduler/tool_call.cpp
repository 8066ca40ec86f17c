#include "drover/scheduler/tool_call.hpp"

#include <stdexcept>

namespace drover::scheduler {

std::string_view tool_call_state_name(const ToolCallState state) {
  switch (state) {
  case ToolCallState::Validating:
    return "validating";
  case ToolCallState::AwaitingApproval:
    return "awaiting_approval";
  case ToolCallState::Scheduled:
    return "scheduled";
  case ToolCallState::Executing:
    return "executing";
  case ToolCallState::Success:
    return "success";
  case ToolCallState::Error:
    return "error";
  case ToolCallState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

bool is_terminal(const ToolCallState state) {
  return state == ToolCallState::Success || state == ToolCallState::Error ||
         state == ToolCallState::Cancelled;
}

bool can_transition(const ToolCallState from, const ToolCallState to) {
  switch (from) {
  case ToolCallState::Validating:
    return to == ToolCallState::AwaitingApproval || to == ToolCallState::Scheduled ||
           to == ToolCallState::Error || to == ToolCallState::Cancelled;
  case ToolCallState::AwaitingApproval:
    return to == ToolCallState::Scheduled || to == ToolCallState::Error ||
           to == ToolCallState::Cancelled;
  case ToolCallState::Scheduled:
    return to == ToolCallState::Executing || to == ToolCallState::Cancelled;
  case ToolCallState::Executing:
    return is_terminal(to);
  case ToolCallState::Success:
  case ToolCallState::Error:
  case ToolCallState::Cancelled:
    return false;
  }
  return false;
}

ToolCallRequest request_from_function_call(const providers::FunctionCall &call,
                                           const std::string &prompt_id) {
  ToolCallRequest out{.call_id = call.id, .name = call.name, .args = {}, .prompt_id = prompt_id};
  auto parsed = tools::parse_tool_args(call.args_json);
  if (parsed.ok()) {
    out.args = std::move(parsed.value());
  } else {
    out.args_error = parsed.error();
  }
  return out;
}

ToolCall::ToolCall(ToolCallRequest request) : request_(std::move(request)) {
  history_.push_back(state_);
}

void ToolCall::transition(const ToolCallState next) {
  if (!can_transition(state_, next)) {
    throw std::logic_error("illegal tool call transition " +
                           std::string(tool_call_state_name(state_)) + " -> " +
                           std::string(tool_call_state_name(next)) + " for " + request_.call_id);
  }
  const auto now = std::chrono::steady_clock::now();
  if (next == ToolCallState::Executing) {
    started_at_ = now;
  }
  if (is_terminal(next)) {
    ended_at_ = now;
  }
  state_ = next;
  history_.push_back(next);
}

std::chrono::milliseconds ToolCall::duration() const {
  if (!started_at_.has_value() || !ended_at_.has_value()) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(*ended_at_ - *started_at_);
}

providers::FunctionResponse ToolCall::to_response() const {
  providers::FunctionResponse response;
  response.call_id = request_.call_id;
  response.name = request_.name;
  switch (state_) {
  case ToolCallState::Success:
    response.output = result_.has_value() ? result_->output : "";
    break;
  case ToolCallState::Cancelled:
    response.output = error_.empty() ? "Tool call cancelled." : error_;
    response.is_error = true;
    break;
  default:
    response.output = error_.empty() ? "Tool call did not complete." : error_;
    response.is_error = true;
    break;
  }
  if (output_file_.has_value()) {
    response.output += "\nFull output saved to: " + *output_file_;
  }
  return response;
}

} // namespace drover::scheduler
