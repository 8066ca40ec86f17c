#include "drover/providers/content.hpp"

namespace drover::providers {

namespace {

// Role and framing overhead per message.
constexpr std::uint64_t kMessageOverheadTokens = 4;

} // namespace

std::string_view role_name(const Role role) {
  switch (role) {
  case Role::User:
    return "user";
  case Role::Model:
    return "model";
  case Role::Tool:
    return "tool";
  }
  return "user";
}

Message Message::user(std::string text) {
  Message message;
  message.role = Role::User;
  message.text = std::move(text);
  return message;
}

Message Message::model(std::string text, std::vector<FunctionCall> calls) {
  Message message;
  message.role = Role::Model;
  message.text = std::move(text);
  message.function_calls = std::move(calls);
  return message;
}

Message Message::tool(FunctionResponse response) {
  Message message;
  message.role = Role::Tool;
  message.function_response = std::move(response);
  return message;
}

bool GeneratorError::transient() const {
  switch (code) {
  case GeneratorErrorCode::RateLimited:
  case GeneratorErrorCode::Server:
  case GeneratorErrorCode::Network:
  case GeneratorErrorCode::Timeout:
    return true;
  default:
    return false;
  }
}

std::string GeneratorError::to_string() const {
  std::string label;
  switch (code) {
  case GeneratorErrorCode::Request:
    label = "request_error";
    break;
  case GeneratorErrorCode::Auth:
    label = "auth_error";
    break;
  case GeneratorErrorCode::RateLimited:
    label = "rate_limited";
    break;
  case GeneratorErrorCode::Server:
    label = "server_error";
    break;
  case GeneratorErrorCode::Network:
    label = "network_error";
    break;
  case GeneratorErrorCode::Timeout:
    label = "timeout";
    break;
  case GeneratorErrorCode::InvalidResponse:
    label = "invalid_response";
    break;
  case GeneratorErrorCode::Cancelled:
    label = "cancelled";
    break;
  }
  std::string out = label;
  if (status != 0) {
    out += " (HTTP " + std::to_string(status) + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

common::Result<std::uint64_t> ContentGenerator::count_tokens(const std::vector<Message> &messages) {
  return common::Result<std::uint64_t>::success(estimate_tokens(messages));
}

common::Result<std::vector<float>> ContentGenerator::embed(const std::string &) {
  return common::Result<std::vector<float>>::failure(name() + " does not support embeddings");
}

std::uint64_t estimate_tokens(std::string_view text) { return (text.size() + 3) / 4; }

std::uint64_t estimate_tokens(const Message &message) {
  std::uint64_t tokens = kMessageOverheadTokens + estimate_tokens(message.text);
  for (const auto &call : message.function_calls) {
    tokens += estimate_tokens(call.name) + estimate_tokens(call.args_json);
  }
  if (message.function_response.has_value()) {
    tokens += estimate_tokens(message.function_response->name) +
              estimate_tokens(message.function_response->output);
  }
  return tokens;
}

std::uint64_t estimate_tokens(const std::vector<Message> &messages) {
  std::uint64_t total = 0;
  for (const auto &message : messages) {
    total += estimate_tokens(message);
  }
  return total;
}

} // namespace drover::providers
