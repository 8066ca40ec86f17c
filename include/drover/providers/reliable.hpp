#pragma once

#include "drover/providers/content.hpp"

#include <memory>

namespace drover::providers {

/// Retries transient failures of another generator with exponential backoff.
/// A stream that has already delivered output is never replayed.
class ReliableGenerator final : public ContentGenerator {
public:
  ReliableGenerator(std::shared_ptr<ContentGenerator> inner, std::uint32_t max_retries,
                    std::uint64_t backoff_ms);

  [[nodiscard]] GenerateResult generate_stream(const GenerateRequest &request,
                                               const StreamEventCallback &on_event,
                                               const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Result<std::uint64_t>
  count_tokens(const std::vector<Message> &messages) override;
  [[nodiscard]] common::Result<std::vector<float>> embed(const std::string &text) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::uint32_t attempts_made() const { return last_attempts_; }

private:
  [[nodiscard]] std::uint64_t delay_for(std::uint32_t attempt, const GeneratorError &error) const;

  std::shared_ptr<ContentGenerator> inner_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
  std::uint32_t last_attempts_ = 0;
};

} // namespace drover::providers
