#pragma once

#include "drover/common/result.hpp"
#include "drover/tools/tool.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drover::bus {

enum class ConfirmationOutcome { ProceedOnce, ProceedAlways, ModifyWithEditor, Cancel };

[[nodiscard]] std::string_view confirmation_outcome_name(ConfirmationOutcome outcome);
[[nodiscard]] common::Result<ConfirmationOutcome>
confirmation_outcome_from_string(const std::string &value);

struct ConfirmationRequest {
  std::string correlation_id;
  std::string call_id;
  std::string tool_name;
  tools::ToolArgs args;
  /// Human-readable summary of what the call will do.
  std::string details;
};

struct ConfirmationResponse {
  std::string correlation_id;
  ConfirmationOutcome outcome = ConfirmationOutcome::Cancel;
  std::optional<tools::ToolArgs> edited_args;
};

/// In-process request/response bus between the scheduler and whoever answers
/// confirmations (a terminal prompt, a test, a remote client).
class MessageBus {
public:
  using RequestHandler = std::function<void(const ConfirmationRequest &)>;
  using ResponseHandler = std::function<void(const ConfirmationResponse &)>;

  std::size_t subscribe_requests(RequestHandler handler);
  std::size_t subscribe_responses(ResponseHandler handler);
  void unsubscribe(std::size_t id);

  /// Records the request as pending and hands it to every request subscriber.
  void publish(const ConfirmationRequest &request);
  /// Routes a response to response subscribers. Unknown correlation ids are dropped.
  [[nodiscard]] common::Status respond(const ConfirmationResponse &response);
  /// Drops a pending request without answering it (the asker gave up).
  void withdraw(const std::string &correlation_id);

  [[nodiscard]] std::vector<ConfirmationRequest> pending() const;

private:
  mutable std::mutex mutex_;
  std::size_t next_id_ = 1;
  std::map<std::size_t, RequestHandler> request_handlers_;
  std::map<std::size_t, ResponseHandler> response_handlers_;
  std::map<std::string, ConfirmationRequest> pending_;
};

} // namespace drover::bus
