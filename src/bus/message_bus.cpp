#include "drover/bus/message_bus.hpp"

#include "drover/common/fs.hpp"

namespace drover::bus {

std::string_view confirmation_outcome_name(const ConfirmationOutcome outcome) {
  switch (outcome) {
  case ConfirmationOutcome::ProceedOnce:
    return "proceed_once";
  case ConfirmationOutcome::ProceedAlways:
    return "proceed_always";
  case ConfirmationOutcome::ModifyWithEditor:
    return "modify_with_editor";
  case ConfirmationOutcome::Cancel:
    return "cancel";
  }
  return "cancel";
}

common::Result<ConfirmationOutcome> confirmation_outcome_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "proceed_once" || normalized == "y" || normalized == "yes") {
    return common::Result<ConfirmationOutcome>::success(ConfirmationOutcome::ProceedOnce);
  }
  if (normalized == "proceed_always" || normalized == "a" || normalized == "always") {
    return common::Result<ConfirmationOutcome>::success(ConfirmationOutcome::ProceedAlways);
  }
  if (normalized == "modify_with_editor" || normalized == "e" || normalized == "edit") {
    return common::Result<ConfirmationOutcome>::success(ConfirmationOutcome::ModifyWithEditor);
  }
  if (normalized == "cancel" || normalized == "n" || normalized == "no") {
    return common::Result<ConfirmationOutcome>::success(ConfirmationOutcome::Cancel);
  }
  return common::Result<ConfirmationOutcome>::failure("unknown confirmation outcome: " + value);
}

std::size_t MessageBus::subscribe_requests(RequestHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t id = next_id_++;
  request_handlers_.emplace(id, std::move(handler));
  return id;
}

std::size_t MessageBus::subscribe_responses(ResponseHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t id = next_id_++;
  response_handlers_.emplace(id, std::move(handler));
  return id;
}

void MessageBus::unsubscribe(const std::size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  request_handlers_.erase(id);
  response_handlers_.erase(id);
}

void MessageBus::publish(const ConfirmationRequest &request) {
  std::vector<RequestHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[request.correlation_id] = request;
    handlers.reserve(request_handlers_.size());
    for (const auto &[id, handler] : request_handlers_) {
      handlers.push_back(handler);
    }
  }
  // Handlers may answer synchronously, which re-enters respond().
  for (const auto &handler : handlers) {
    handler(request);
  }
}

common::Status MessageBus::respond(const ConfirmationResponse &response) {
  std::vector<ResponseHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.erase(response.correlation_id) == 0) {
      return common::Status::error("no pending confirmation with id " + response.correlation_id);
    }
    handlers.reserve(response_handlers_.size());
    for (const auto &[id, handler] : response_handlers_) {
      handlers.push_back(handler);
    }
  }
  for (const auto &handler : handlers) {
    handler(response);
  }
  return common::Status::success();
}

void MessageBus::withdraw(const std::string &correlation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.erase(correlation_id);
}

std::vector<ConfirmationRequest> MessageBus::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConfirmationRequest> out;
  out.reserve(pending_.size());
  for (const auto &[id, request] : pending_) {
    out.push_back(request);
  }
  return out;
}

} // namespace drover::bus
