#include "drover/providers/reliable.hpp"

#include "drover/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace drover::providers {

namespace {

constexpr std::uint64_t kMaxBackoffMs = 30'000;

} // namespace

ReliableGenerator::ReliableGenerator(std::shared_ptr<ContentGenerator> inner,
                                     const std::uint32_t max_retries,
                                     const std::uint64_t backoff_ms)
    : inner_(std::move(inner)), max_retries_(max_retries), backoff_ms_(backoff_ms) {}

std::uint64_t ReliableGenerator::delay_for(const std::uint32_t attempt,
                                           const GeneratorError &error) const {
  const std::uint64_t exponential = backoff_ms_ * (1ULL << std::min<std::uint32_t>(attempt, 16));
  const std::uint64_t delay = std::max(exponential, error.retry_after_ms.value_or(0));
  return std::min(delay, kMaxBackoffMs);
}

GenerateResult ReliableGenerator::generate_stream(const GenerateRequest &request,
                                                  const StreamEventCallback &on_event,
                                                  const common::CancellationToken &cancel) {
  GenerateResult result;
  for (std::uint32_t attempt = 0; attempt <= max_retries_; ++attempt) {
    last_attempts_ = attempt + 1;
    const auto started = std::chrono::steady_clock::now();
    result = inner_->generate_stream(request, on_event, cancel);
    observability::record_metric(observability::RequestLatencyMetric{
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)});

    if (result.ok() || !result.error->transient() || result.emitted_output ||
        attempt == max_retries_) {
      return result;
    }

    const std::uint64_t delay = delay_for(attempt, *result.error);
    observability::log_warn("provider", inner_->name() + " attempt " + std::to_string(attempt + 1) +
                                            " failed (" + result.error->to_string() +
                                            "); retrying in " + std::to_string(delay) + "ms");
    if (cancel.wait_for(std::chrono::milliseconds(delay))) {
      result.error = GeneratorError{.code = GeneratorErrorCode::Cancelled,
                                    .message = "cancelled while waiting to retry"};
      return result;
    }
  }
  return result;
}

common::Result<std::uint64_t> ReliableGenerator::count_tokens(const std::vector<Message> &messages) {
  return inner_->count_tokens(messages);
}

common::Result<std::vector<float>> ReliableGenerator::embed(const std::string &text) {
  auto result = inner_->embed(text);
  for (std::uint32_t attempt = 0; !result.ok() && attempt < max_retries_; ++attempt) {
    std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms_ * (1ULL << attempt)));
    result = inner_->embed(text);
  }
  return result;
}

std::string ReliableGenerator::name() const { return "reliable(" + inner_->name() + ")"; }

} // namespace drover::providers
