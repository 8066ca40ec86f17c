#pragma once

#include "drover/common/cancellation.hpp"
#include "drover/common/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drover::providers {

enum class Role { User, Model, Tool };

[[nodiscard]] std::string_view role_name(Role role);

struct FunctionCall {
  std::string id;
  std::string name;
  /// Arguments as a JSON object text.
  std::string args_json = "{}";
};

struct FunctionResponse {
  std::string call_id;
  std::string name;
  std::string output;
  bool is_error = false;
};

/// One entry of conversation history.
struct Message {
  Role role = Role::User;
  std::string text;
  std::vector<FunctionCall> function_calls;
  std::optional<FunctionResponse> function_response;
  bool thought = false;

  [[nodiscard]] static Message user(std::string text);
  [[nodiscard]] static Message model(std::string text, std::vector<FunctionCall> calls = {});
  [[nodiscard]] static Message tool(FunctionResponse response);

  [[nodiscard]] bool is_function_response() const { return function_response.has_value(); }
  [[nodiscard]] bool has_function_calls() const { return !function_calls.empty(); }
};

struct ToolDeclaration {
  std::string name;
  std::string description;
  std::string parameters_json = R"({"type":"object","properties":{}})";
};

struct GenerateRequest {
  std::optional<std::string> system_prompt;
  std::vector<Message> messages;
  std::vector<ToolDeclaration> tools;
  double temperature = 0.7;
  std::optional<std::uint32_t> max_output_tokens;
};

enum class StreamEventKind { Delta, ToolCall, Usage };

struct StreamEvent {
  StreamEventKind kind = StreamEventKind::Delta;
  std::string text;
  FunctionCall call;
  std::uint64_t total_tokens = 0;
};

using StreamEventCallback = std::function<void(const StreamEvent &)>;

enum class GeneratorErrorCode {
  Request,
  Auth,
  RateLimited,
  Server,
  Network,
  Timeout,
  InvalidResponse,
  Cancelled,
};

struct GeneratorError {
  GeneratorErrorCode code = GeneratorErrorCode::Request;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after_ms;

  /// Rate limits, 5xx and transport failures.
  [[nodiscard]] bool transient() const;
  [[nodiscard]] std::string to_string() const;
};

struct GenerateSummary {
  std::string text;
  std::vector<FunctionCall> calls;
  std::optional<std::uint64_t> total_tokens;
  std::string finish_reason;
};

struct GenerateResult {
  GenerateSummary summary;
  std::optional<GeneratorError> error;
  /// True once any delta or tool call reached the caller's callback.
  bool emitted_output = false;

  [[nodiscard]] bool ok() const { return !error.has_value(); }
};

class ContentGenerator {
public:
  virtual ~ContentGenerator() = default;

  [[nodiscard]] virtual GenerateResult generate_stream(const GenerateRequest &request,
                                                       const StreamEventCallback &on_event,
                                                       const common::CancellationToken &cancel) = 0;

  [[nodiscard]] virtual common::Result<std::uint64_t>
  count_tokens(const std::vector<Message> &messages);

  [[nodiscard]] virtual common::Result<std::vector<float>> embed(const std::string &text);

  [[nodiscard]] virtual std::string name() const = 0;
};

/// Byte-length estimate (four bytes per token, rounded up).
[[nodiscard]] std::uint64_t estimate_tokens(std::string_view text);
[[nodiscard]] std::uint64_t estimate_tokens(const Message &message);
[[nodiscard]] std::uint64_t estimate_tokens(const std::vector<Message> &messages);

} // namespace drover::providers
