#include "drover/agent/turn_engine.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/hash.hpp"
#include "drover/observability/global.hpp"

#include <algorithm>

namespace drover::agent {

namespace {

constexpr std::string_view kComponent = "turn";

TurnEvent make_error(std::string message, const bool cancelled) {
  TurnEvent event;
  event.kind = TurnEventKind::Error;
  event.text = std::move(message);
  event.cancelled = cancelled;
  return event;
}

/// Drops unnamed calls and fills in missing ids.
std::vector<providers::FunctionCall> sanitize_calls(std::vector<providers::FunctionCall> calls) {
  std::vector<providers::FunctionCall> out;
  out.reserve(calls.size());
  for (auto &call : calls) {
    if (common::trim(call.name).empty()) {
      continue;
    }
    if (call.id.empty()) {
      call.id = common::random_id("call_");
    }
    if (common::trim(call.args_json).empty()) {
      call.args_json = "{}";
    }
    out.push_back(std::move(call));
  }
  return out;
}

} // namespace

std::string_view turn_event_kind_name(const TurnEventKind kind) {
  switch (kind) {
  case TurnEventKind::Delta:
    return "delta";
  case TurnEventKind::ToolCallRequested:
    return "tool_call_requested";
  case TurnEventKind::Retry:
    return "retry";
  case TurnEventKind::Compressed:
    return "compressed";
  case TurnEventKind::TurnComplete:
    return "turn_complete";
  case TurnEventKind::Error:
    return "error";
  }
  return "unknown";
}

bool is_valid_model_message(const providers::Message &message) {
  if (message.thought) {
    return true;
  }
  if (!common::trim(message.text).empty()) {
    return true;
  }
  return std::any_of(message.function_calls.begin(), message.function_calls.end(),
                     [](const auto &call) { return !common::trim(call.name).empty(); });
}

TurnOutcome TurnStream::collect(const std::function<void(const TurnEvent &)> &on_event) {
  TurnOutcome outcome;
  while (auto event = channel_->pop()) {
    if (on_event) {
      on_event(*event);
    }
    switch (event->kind) {
    case TurnEventKind::Delta:
      outcome.text += event->text;
      break;
    case TurnEventKind::ToolCallRequested:
      outcome.calls.push_back(event->call);
      break;
    case TurnEventKind::Retry:
      // Deltas of a rejected attempt never count.
      outcome.text.clear();
      outcome.calls.clear();
      break;
    case TurnEventKind::Compressed:
      break;
    case TurnEventKind::TurnComplete:
      outcome.completed = true;
      outcome.attempts = event->attempt;
      outcome.total_tokens = event->summary.total_tokens;
      outcome.text = event->summary.text;
      break;
    case TurnEventKind::Error:
      outcome.error = event->text;
      outcome.cancelled = event->cancelled;
      outcome.attempts = event->attempt;
      break;
    }
  }
  return outcome;
}

TurnEngine::TurnEngine(providers::ContentGenerator &generator, context::ContextManager *context,
                       TurnEngineOptions options)
    : generator_(generator), context_(context), options_(std::move(options)) {
  worker_ = std::thread([this] { worker_loop(); });
}

TurnEngine::~TurnEngine() {
  stopping_ = true;
  requests_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

TurnStream TurnEngine::send_turn(std::vector<providers::Message> new_content,
                                 common::CancellationToken cancel) {
  auto events = std::make_shared<common::Channel<TurnEvent>>();
  PendingTurn turn{.content = std::move(new_content), .cancel = std::move(cancel),
                   .events = events};
  if (!requests_.push(std::move(turn))) {
    events->push(make_error("Turn engine shut down", true));
    events->close();
  }
  return TurnStream(events);
}

std::vector<providers::Message> TurnEngine::curated_history() const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  return curated_;
}

std::vector<providers::Message> TurnEngine::comprehensive_history() const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  return comprehensive_;
}

void TurnEngine::replace_history(std::vector<providers::Message> history) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  comprehensive_ = history;
  curated_ = std::move(history);
}

void TurnEngine::append_history(const std::vector<providers::Message> &messages) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  comprehensive_.insert(comprehensive_.end(), messages.begin(), messages.end());
  curated_.insert(curated_.end(), messages.begin(), messages.end());
}

void TurnEngine::set_system_prompt(std::optional<std::string> prompt) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  options_.system_prompt = std::move(prompt);
}

void TurnEngine::set_tools(std::vector<providers::ToolDeclaration> tools) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  options_.tools = std::move(tools);
}

void TurnEngine::worker_loop() {
  while (auto turn = requests_.pop()) {
    if (stopping_) {
      turn->events->push(make_error("Turn engine shut down", true));
      turn->events->close();
      continue;
    }
    try {
      run_turn(*turn);
    } catch (const std::exception &e) {
      observability::record_error(std::string(kComponent), e.what());
      turn->events->push(make_error(std::string("Turn failed: ") + e.what(), false));
    }
    turn->events->close();
  }
}

void TurnEngine::maybe_compress(PendingTurn &turn) {
  if (context_ == nullptr) {
    return;
  }
  const auto history = curated_history();
  if (history.empty() || !context_->needs_compression(history, turn.content)) {
    return;
  }
  auto result = context_->compress(history, false, turn.cancel, turn.content);
  if (!result.new_history.has_value()) {
    if (result.record.status != context::CompressionStatus::Noop) {
      observability::log_warn(std::string(kComponent),
                              "compression failed: " +
                                  std::string(context::compression_status_name(
                                      result.record.status)));
    }
    return;
  }
  replace_history(std::move(*result.new_history));
  TurnEvent event;
  event.kind = TurnEventKind::Compressed;
  event.compression = result.record;
  turn.events->push(std::move(event));
}

void TurnEngine::run_turn(PendingTurn &turn) {
  if (turn.cancel.cancelled()) {
    turn.events->push(make_error("Turn cancelled: " + turn.cancel.reason(), true));
    return;
  }

  maybe_compress(turn);

  providers::GenerateRequest request;
  {
    std::lock_guard<std::mutex> lock(history_mutex_);
    comprehensive_.insert(comprehensive_.end(), turn.content.begin(), turn.content.end());
    request.system_prompt = options_.system_prompt;
    request.tools = options_.tools;
    request.messages = curated_;
  }
  request.messages.insert(request.messages.end(), turn.content.begin(), turn.content.end());
  request.max_output_tokens = options_.max_output_tokens;

  const std::uint32_t max_attempts = options_.max_invalid_retries + 1;
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    request.temperature =
        std::min(options_.max_temperature,
                 options_.temperature + options_.temperature_step * (attempt - 1));

    auto on_event = [&turn](const providers::StreamEvent &stream_event) {
      if (stream_event.kind != providers::StreamEventKind::Delta || stream_event.text.empty()) {
        return;
      }
      TurnEvent event;
      event.kind = TurnEventKind::Delta;
      event.text = stream_event.text;
      turn.events->push(std::move(event));
    };
    auto result = generator_.generate_stream(request, on_event, turn.cancel);

    if (turn.cancel.cancelled() ||
        (result.error.has_value() &&
         result.error->code == providers::GeneratorErrorCode::Cancelled)) {
      auto event = make_error("Turn cancelled: " + turn.cancel.reason(), true);
      event.attempt = attempt;
      turn.events->push(std::move(event));
      return;
    }

    const bool malformed_stream =
        result.error.has_value() &&
        result.error->code == providers::GeneratorErrorCode::InvalidResponse &&
        !result.emitted_output;
    if (result.error.has_value() && !malformed_stream) {
      observability::record_error(std::string(kComponent), result.error->to_string());
      auto event = make_error(result.error->to_string(), false);
      event.attempt = attempt;
      turn.events->push(std::move(event));
      return;
    }

    auto model = providers::Message::model(result.summary.text,
                                           sanitize_calls(result.summary.calls));
    if (!malformed_stream && is_valid_model_message(model)) {
      {
        std::lock_guard<std::mutex> lock(history_mutex_);
        comprehensive_.push_back(model);
        curated_.insert(curated_.end(), turn.content.begin(), turn.content.end());
        curated_.push_back(model);
      }
      for (const auto &call : model.function_calls) {
        TurnEvent event;
        event.kind = TurnEventKind::ToolCallRequested;
        event.call = call;
        turn.events->push(std::move(event));
      }
      const auto turn_number = ++turns_completed_;
      observability::record_turn_complete(options_.agent_id, turn_number, attempt,
                                          result.summary.total_tokens);
      if (result.summary.total_tokens.has_value()) {
        observability::record_metric(
            observability::TokensUsedMetric{.tokens = *result.summary.total_tokens});
      }
      TurnEvent done;
      done.kind = TurnEventKind::TurnComplete;
      done.summary = result.summary;
      done.summary.calls = model.function_calls;
      done.attempt = attempt;
      turn.events->push(std::move(done));
      return;
    }

    {
      std::lock_guard<std::mutex> lock(history_mutex_);
      if (!malformed_stream && !(model.text.empty() && model.function_calls.empty())) {
        comprehensive_.push_back(model);
      }
    }
    const std::string why = malformed_stream ? result.error->to_string()
                                             : std::string("empty model response");
    observability::log_warn(std::string(kComponent), "invalid model output (attempt " +
                                                         std::to_string(attempt) + "): " + why);
    if (attempt < max_attempts) {
      TurnEvent retry;
      retry.kind = TurnEventKind::Retry;
      retry.attempt = attempt;
      retry.text = why;
      turn.events->push(std::move(retry));
    }
  }

  auto event = make_error("Model returned an empty or invalid response after " +
                              std::to_string(max_attempts) + " attempts.",
                          false);
  event.attempt = max_attempts;
  turn.events->push(std::move(event));
}

} // namespace drover::agent
