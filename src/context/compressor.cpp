#include "drover/context/compressor.hpp"

#include "drover/common/fs.hpp"
#include "drover/observability/global.hpp"

#include <stdexcept>

namespace drover::context {

namespace {

constexpr std::string_view kSummarySystemPrompt =
    "You condense an agent conversation into a state snapshot that replaces it. "
    "Keep the user's overall goal, decisions made, files touched, commands run and "
    "their outcomes, open problems, and the immediate next step. Drop chit-chat. "
    "Answer with a single <state_snapshot> block and nothing else.";

constexpr std::string_view kSummaryRequest =
    "Write the <state_snapshot> for the conversation so far.";

constexpr std::string_view kSummaryAck = "Got it. Thanks for the additional context!";

std::uint64_t count_tokens(providers::ContentGenerator &generator,
                           const std::vector<providers::Message> &messages) {
  auto counted = generator.count_tokens(messages);
  if (counted.ok()) {
    return counted.value();
  }
  return providers::estimate_tokens(messages);
}

} // namespace

std::string_view compression_status_name(const CompressionStatus status) {
  switch (status) {
  case CompressionStatus::Noop:
    return "noop";
  case CompressionStatus::Compressed:
    return "compressed";
  case CompressionStatus::FailedInflatedTokenCount:
    return "failed_inflated_token_count";
  case CompressionStatus::FailedEmptySummary:
    return "failed_empty_summary";
  case CompressionStatus::FailedGenerationError:
    return "failed_generation_error";
  }
  return "noop";
}

std::size_t message_weight(const providers::Message &message) {
  // Framing overhead, so empty messages still occupy space.
  std::size_t weight = 16 + message.text.size();
  for (const auto &call : message.function_calls) {
    weight += call.name.size() + call.args_json.size() + 16;
  }
  if (message.function_response.has_value()) {
    weight += message.function_response->name.size() + message.function_response->output.size() + 16;
  }
  return weight;
}

std::size_t find_split_point(const std::vector<providers::Message> &history,
                             const double fraction) {
  if (!(fraction > 0.0 && fraction < 1.0)) {
    throw std::invalid_argument("Fraction must be between 0 and 1");
  }

  std::size_t total = 0;
  std::vector<std::size_t> weights;
  weights.reserve(history.size());
  for (const auto &message : history) {
    weights.push_back(message_weight(message));
    total += weights.back();
  }
  const double target = static_cast<double>(total) * fraction;

  std::size_t last_split = 0;
  std::size_t cumulative = 0;
  for (std::size_t i = 0; i < history.size(); ++i) {
    const auto &message = history[i];
    if (message.role == providers::Role::User && !message.is_function_response()) {
      if (static_cast<double>(cumulative) >= target) {
        return i;
      }
      last_split = i;
    }
    cumulative += weights[i];
  }

  if (!history.empty()) {
    const auto &last = history.back();
    if (last.role == providers::Role::Model && !last.has_function_calls()) {
      return history.size();
    }
  }
  return last_split;
}

Compressor::Compressor(providers::ContentGenerator &generator, CompressorOptions options)
    : generator_(generator), options_(options) {}

CompressionResult Compressor::finish(CompressionRecord record, const bool force,
                                     std::optional<std::vector<providers::Message>> history) {
  if (!record.succeeded && record.status != CompressionStatus::Noop) {
    // A forced attempt does not poison later automatic ones.
    failed_attempt_ = failed_attempt_ || !force;
  }
  if (record.status != CompressionStatus::Noop) {
    records_.push_back(record);
    observability::record_compression(record.original_tokens, record.summary_tokens,
                                      record.succeeded);
  }
  return CompressionResult{.new_history = std::move(history), .record = record};
}

CompressionResult Compressor::compress(const std::vector<providers::Message> &history,
                                       const bool force, const common::CancellationToken &cancel,
                                       const std::vector<providers::Message> &pending) {
  CompressionRecord record;
  if (history.empty()) {
    return finish(record, force, std::nullopt);
  }
  if (!force && failed_attempt_) {
    return finish(record, force, std::nullopt);
  }
  if (!force) {
    std::vector<providers::Message> prospective = history;
    prospective.insert(prospective.end(), pending.begin(), pending.end());
    const auto tokens = count_tokens(generator_, prospective);
    const double limit = options_.threshold * static_cast<double>(options_.context_window);
    if (static_cast<double>(tokens) < limit) {
      return finish(record, force, std::nullopt);
    }
  }

  const std::size_t split = find_split_point(history, 1.0 - options_.preserve_fraction);
  record.split_index = split;
  if (split == 0) {
    return finish(record, force, std::nullopt);
  }

  const std::vector<providers::Message> head(history.begin(),
                                             history.begin() + static_cast<std::ptrdiff_t>(split));
  record.original_tokens = count_tokens(generator_, head);

  providers::GenerateRequest request;
  request.system_prompt = std::string(kSummarySystemPrompt);
  request.messages = head;
  request.messages.push_back(providers::Message::user(std::string(kSummaryRequest)));
  request.temperature = 0.0;
  request.max_output_tokens = options_.max_summary_tokens;

  const auto generated = generator_.generate_stream(
      request, [](const providers::StreamEvent &) {}, cancel);
  if (!generated.ok()) {
    observability::log_warn("context", "compression call failed: " + generated.error->to_string());
    record.status = CompressionStatus::FailedGenerationError;
    return finish(record, force, std::nullopt);
  }

  const std::string summary = common::trim(generated.summary.text);
  if (summary.empty()) {
    record.status = CompressionStatus::FailedEmptySummary;
    return finish(record, force, std::nullopt);
  }

  const auto summary_message = providers::Message::user(summary);
  record.summary_tokens = count_tokens(generator_, {summary_message});
  if (record.summary_tokens >= record.original_tokens) {
    record.status = CompressionStatus::FailedInflatedTokenCount;
    return finish(record, force, std::nullopt);
  }

  std::vector<providers::Message> replaced;
  replaced.reserve(history.size() - split + 2);
  replaced.push_back(summary_message);
  replaced.push_back(providers::Message::model(std::string(kSummaryAck)));
  replaced.insert(replaced.end(), history.begin() + static_cast<std::ptrdiff_t>(split),
                  history.end());

  record.succeeded = true;
  record.status = CompressionStatus::Compressed;
  return finish(record, force, std::move(replaced));
}

} // namespace drover::context
