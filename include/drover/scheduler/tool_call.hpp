#pragma once

#include "drover/bus/message_bus.hpp"
#include "drover/providers/content.hpp"
#include "drover/tools/tool.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drover::scheduler {

enum class ToolCallState {
  Validating,
  AwaitingApproval,
  Scheduled,
  Executing,
  Success,
  Error,
  Cancelled,
};

[[nodiscard]] std::string_view tool_call_state_name(ToolCallState state);
[[nodiscard]] bool is_terminal(ToolCallState state);
/// True when `to` is reachable from `from` in one step of the forward-only graph.
[[nodiscard]] bool can_transition(ToolCallState from, ToolCallState to);

struct ToolCallRequest {
  std::string call_id;
  std::string name;
  tools::ToolArgs args;
  std::string prompt_id;
  /// Set when the model's argument JSON could not be parsed; validation fails on it.
  std::string args_error;
};

[[nodiscard]] ToolCallRequest request_from_function_call(const providers::FunctionCall &call,
                                                         const std::string &prompt_id);

class ToolCall {
public:
  explicit ToolCall(ToolCallRequest request);

  /// Moves to `next`; throws std::logic_error on a backwards or skipping transition.
  void transition(ToolCallState next);

  [[nodiscard]] const ToolCallRequest &request() const { return request_; }
  [[nodiscard]] ToolCallState state() const { return state_; }
  [[nodiscard]] const std::vector<ToolCallState> &history() const { return history_; }
  [[nodiscard]] bool terminal() const { return is_terminal(state_); }

  void set_args(tools::ToolArgs args) { request_.args = std::move(args); }
  void set_result(tools::ToolResult result) { result_ = std::move(result); }
  void set_error(std::string error) { error_ = std::move(error); }
  void set_output_file(std::string path) { output_file_ = std::move(path); }
  void set_correlation_id(std::string id) { correlation_id_ = std::move(id); }
  void set_outcome(bus::ConfirmationOutcome outcome) { outcome_ = outcome; }

  [[nodiscard]] const std::optional<tools::ToolResult> &result() const { return result_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] const std::optional<std::string> &output_file() const { return output_file_; }
  [[nodiscard]] const std::optional<std::string> &correlation_id() const {
    return correlation_id_;
  }
  [[nodiscard]] const std::optional<bus::ConfirmationOutcome> &outcome() const {
    return outcome_;
  }

  [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> started_at() const {
    return started_at_;
  }
  [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> ended_at() const {
    return ended_at_;
  }
  [[nodiscard]] std::chrono::milliseconds duration() const;

  /// The tool-result message folded back into conversation history.
  [[nodiscard]] providers::FunctionResponse to_response() const;

private:
  ToolCallRequest request_;
  ToolCallState state_ = ToolCallState::Validating;
  std::vector<ToolCallState> history_;
  std::optional<tools::ToolResult> result_;
  std::string error_;
  std::optional<std::string> output_file_;
  std::optional<std::string> correlation_id_;
  std::optional<bus::ConfirmationOutcome> outcome_;
  std::optional<std::chrono::steady_clock::time_point> started_at_;
  std::optional<std::chrono::steady_clock::time_point> ended_at_;
};

} // namespace drover::scheduler
