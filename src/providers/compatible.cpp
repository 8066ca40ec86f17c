#include "drover/providers/compatible.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/json_util.hpp"

#include <cstdlib>
#include <sstream>

namespace drover::providers {

namespace {

void write_message(std::ostringstream &body, const Message &message) {
  switch (message.role) {
  case Role::User:
    body << R"({"role":"user","content":)" << common::json_quote(message.text) << "}";
    return;
  case Role::Tool: {
    const auto &response = *message.function_response;
    body << R"({"role":"tool","tool_call_id":)" << common::json_quote(response.call_id)
         << R"(,"content":)" << common::json_quote(response.output) << "}";
    return;
  }
  case Role::Model:
    break;
  }

  body << R"({"role":"assistant","content":)";
  if (message.text.empty()) {
    body << "null";
  } else {
    body << common::json_quote(message.text);
  }
  if (!message.function_calls.empty()) {
    body << R"(,"tool_calls":[)";
    for (std::size_t i = 0; i < message.function_calls.size(); ++i) {
      const auto &call = message.function_calls[i];
      if (i > 0) {
        body << ',';
      }
      body << R"({"id":)" << common::json_quote(call.id) << R"(,"type":"function","function":{)"
           << R"("name":)" << common::json_quote(call.name) << R"(,"arguments":)"
           << common::json_quote(call.args_json) << "}}";
    }
    body << ']';
  }
  body << '}';
}

} // namespace

SseStreamDecoder::SseStreamDecoder(StreamEventCallback on_event) : on_event_(std::move(on_event)) {}

void SseStreamDecoder::feed(std::string_view bytes) {
  line_buffer_.append(bytes);
  std::size_t line_end = std::string::npos;
  while ((line_end = line_buffer_.find('\n')) != std::string::npos) {
    std::string line = line_buffer_.substr(0, line_end);
    line_buffer_.erase(0, line_end + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      if (!event_data_.empty()) {
        handle_event(event_data_);
        event_data_.clear();
      }
      continue;
    }
    if (line.rfind("data:", 0) != 0) {
      continue;
    }
    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
      payload.erase(payload.begin());
    }
    if (!event_data_.empty()) {
      event_data_.push_back('\n');
    }
    event_data_ += payload;
  }
}

void SseStreamDecoder::handle_event(const std::string &data) {
  if (common::trim(data) == "[DONE]") {
    saw_done_ = true;
    return;
  }

  if (auto error = common::json_field(data, "error"); error.has_value()) {
    stream_error_ = common::json_get_string(*error, "message");
    if (stream_error_.empty()) {
      stream_error_ = *error;
    }
    return;
  }

  if (auto usage = common::json_field(data, "usage");
      usage.has_value() && common::json_kind(*usage) == common::JsonKind::Object) {
    if (auto total = common::json_get_number(*usage, "total_tokens"); total.has_value()) {
      summary_.total_tokens = static_cast<std::uint64_t>(*total);
      if (on_event_) {
        on_event_(StreamEvent{.kind = StreamEventKind::Usage, .total_tokens = *summary_.total_tokens});
      }
    }
  }

  const auto choices = common::json_field(data, "choices");
  if (!choices.has_value()) {
    return;
  }
  const auto items = common::json_array_items(*choices);
  if (items.empty()) {
    return;
  }
  const std::string &choice = items.front();
  if (auto reason = common::json_field(choice, "finish_reason"); reason.has_value()) {
    if (auto text = common::json_as_string(*reason); text.has_value()) {
      summary_.finish_reason = *text;
    }
  }

  const auto delta = common::json_field(choice, "delta");
  if (!delta.has_value()) {
    return;
  }
  if (auto content = common::json_field(*delta, "content"); content.has_value()) {
    if (auto text = common::json_as_string(*content); text.has_value() && !text->empty()) {
      summary_.text += *text;
      emitted_output_ = true;
      if (on_event_) {
        on_event_(StreamEvent{.kind = StreamEventKind::Delta, .text = *text});
      }
    }
  }
  if (auto calls = common::json_field(*delta, "tool_calls"); calls.has_value()) {
    for (const auto &raw : common::json_array_items(*calls)) {
      handle_tool_call_delta(raw);
    }
  }
}

void SseStreamDecoder::handle_tool_call_delta(const std::string &raw) {
  const int index = static_cast<int>(common::json_get_number(raw, "index").value_or(0.0));
  auto &partial = partial_calls_[index];
  if (const std::string id = common::json_get_string(raw, "id"); !id.empty()) {
    partial.id = id;
  }
  if (auto function = common::json_field(raw, "function"); function.has_value()) {
    partial.name += common::json_get_string(*function, "name");
    partial.arguments += common::json_get_string(*function, "arguments");
  }
}

GenerateSummary SseStreamDecoder::finish() {
  if (!event_data_.empty()) {
    handle_event(event_data_);
    event_data_.clear();
  }
  for (auto &[index, partial] : partial_calls_) {
    if (partial.name.empty()) {
      continue;
    }
    FunctionCall call{.id = partial.id.empty() ? "call_" + std::to_string(index) : partial.id,
                      .name = partial.name,
                      .args_json = common::trim(partial.arguments).empty() ? "{}" : partial.arguments};
    summary_.calls.push_back(call);
    emitted_output_ = true;
    if (on_event_) {
      on_event_(StreamEvent{.kind = StreamEventKind::ToolCall, .call = std::move(call)});
    }
  }
  partial_calls_.clear();
  return summary_;
}

CompatibleGenerator::CompatibleGenerator(CompatibleGeneratorOptions options,
                                         std::shared_ptr<HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

HttpHeaders CompatibleGenerator::headers() const {
  HttpHeaders out = {{"Content-Type", "application/json"}};
  if (!options_.api_key.empty()) {
    out["Authorization"] = "Bearer " + options_.api_key;
  }
  return out;
}

std::string CompatibleGenerator::build_body(const GenerateRequest &request) const {
  std::ostringstream body;
  body << R"({"model":)" << common::json_quote(options_.model) << R"(,"messages":[)";
  bool first = true;
  if (request.system_prompt.has_value() && !request.system_prompt->empty()) {
    body << R"({"role":"system","content":)" << common::json_quote(*request.system_prompt) << "}";
    first = false;
  }
  for (const auto &message : request.messages) {
    if (message.thought) {
      continue;
    }
    if (!first) {
      body << ',';
    }
    first = false;
    write_message(body, message);
  }
  body << ']';

  if (!request.tools.empty()) {
    body << R"(,"tools":[)";
    for (std::size_t i = 0; i < request.tools.size(); ++i) {
      const auto &tool = request.tools[i];
      if (i > 0) {
        body << ',';
      }
      body << R"({"type":"function","function":{"name":)" << common::json_quote(tool.name)
           << R"(,"description":)" << common::json_quote(tool.description)
           << R"(,"parameters":)" << tool.parameters_json << "}}";
    }
    body << R"(],"tool_choice":"auto")";
  }
  body << R"(,"temperature":)" << request.temperature;
  if (request.max_output_tokens.has_value()) {
    body << R"(,"max_tokens":)" << *request.max_output_tokens;
  }
  body << R"(,"stream":true,"stream_options":{"include_usage":true}})";
  return body.str();
}

std::optional<GeneratorError> CompatibleGenerator::map_status(const HttpResponse &response) {
  if (response.cancelled) {
    return GeneratorError{.code = GeneratorErrorCode::Cancelled, .message = "request cancelled"};
  }
  if (response.timeout) {
    return GeneratorError{.code = GeneratorErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return GeneratorError{.code = GeneratorErrorCode::Network,
                          .message = response.network_error_message};
  }
  const auto status = response.status;
  if (status >= 200 && status < 300) {
    return std::nullopt;
  }

  GeneratorError error{.status = status, .message = response.body};
  if (status == 401 || status == 403) {
    error.code = GeneratorErrorCode::Auth;
  } else if (status == 429) {
    error.code = GeneratorErrorCode::RateLimited;
    if (auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      char *end = nullptr;
      const unsigned long long seconds = std::strtoull(it->second.c_str(), &end, 10);
      if (end != it->second.c_str()) {
        error.retry_after_ms = seconds * 1000ULL;
      }
    }
  } else if (status >= 500) {
    error.code = GeneratorErrorCode::Server;
  } else {
    error.code = GeneratorErrorCode::Request;
  }
  return error;
}

GenerateResult CompatibleGenerator::generate_stream(const GenerateRequest &request,
                                                    const StreamEventCallback &on_event,
                                                    const common::CancellationToken &cancel) {
  GenerateResult result;
  if (options_.api_key.empty()) {
    result.error = GeneratorError{.code = GeneratorErrorCode::Auth, .message = "missing API key"};
    return result;
  }

  SseStreamDecoder decoder(on_event);
  const auto response = http_client_->post_json_stream(
      options_.base_url + "/chat/completions", headers(), build_body(request), options_.timeout_ms,
      [&decoder](std::string_view bytes) { decoder.feed(bytes); }, cancel);

  result.emitted_output = decoder.emitted_output();
  if (auto error = map_status(response); error.has_value()) {
    result.error = std::move(error);
    return result;
  }

  result.summary = decoder.finish();
  result.emitted_output = decoder.emitted_output();
  if (!decoder.stream_error().empty()) {
    result.error = GeneratorError{.code = GeneratorErrorCode::Server,
                                  .message = decoder.stream_error()};
  } else if (!decoder.saw_done() && !result.emitted_output) {
    result.error = GeneratorError{.code = GeneratorErrorCode::InvalidResponse,
                                  .message = "stream ended without any data"};
  }
  return result;
}

common::Result<std::vector<float>> CompatibleGenerator::embed(const std::string &text) {
  if (options_.api_key.empty()) {
    return common::Result<std::vector<float>>::failure("missing API key");
  }
  const std::string body = R"({"model":)" + common::json_quote(options_.embedding_model) +
                           R"(,"input":)" + common::json_quote(text) + "}";
  const auto response =
      http_client_->post_json(options_.base_url + "/embeddings", headers(), body, options_.timeout_ms);
  if (auto error = map_status(response); error.has_value()) {
    return common::Result<std::vector<float>>::failure(error->to_string());
  }

  const auto data = common::json_field(response.body, "data");
  const auto items = data.has_value() ? common::json_array_items(*data) : std::vector<std::string>{};
  if (items.empty()) {
    return common::Result<std::vector<float>>::failure("embedding response has no data");
  }
  const auto embedding = common::json_field(items.front(), "embedding");
  if (!embedding.has_value()) {
    return common::Result<std::vector<float>>::failure("embedding response has no vector");
  }
  std::vector<float> vector;
  for (const auto &value : common::json_array_items(*embedding)) {
    const auto number = common::json_as_number(value);
    if (!number.has_value()) {
      return common::Result<std::vector<float>>::failure("embedding contains a non-number");
    }
    vector.push_back(static_cast<float>(*number));
  }
  return common::Result<std::vector<float>>::success(std::move(vector));
}

} // namespace drover::providers
