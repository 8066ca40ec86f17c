#pragma once

#include "drover/common/cancellation.hpp"
#include "drover/providers/content.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace drover::context {

enum class CompressionStatus {
  Noop,
  Compressed,
  FailedInflatedTokenCount,
  FailedEmptySummary,
  FailedGenerationError,
};

[[nodiscard]] std::string_view compression_status_name(CompressionStatus status);

struct CompressionRecord {
  std::size_t split_index = 0;
  std::uint64_t original_tokens = 0;
  std::uint64_t summary_tokens = 0;
  bool succeeded = false;
  CompressionStatus status = CompressionStatus::Noop;
};

struct CompressionResult {
  /// Set only when the history was actually replaced.
  std::optional<std::vector<providers::Message>> new_history;
  CompressionRecord record;
};

struct CompressorOptions {
  /// Compress once history exceeds this fraction of the context window.
  double threshold = 0.2;
  /// Trailing share of the conversation kept verbatim.
  double preserve_fraction = 0.3;
  std::uint64_t context_window = 128'000;
  std::optional<std::uint32_t> max_summary_tokens;
};

/// Index at which to cut `history` so roughly `fraction` of its characters come before
/// the cut. Cuts only land on plain user messages. Throws std::invalid_argument unless
/// 0 < fraction < 1.
[[nodiscard]] std::size_t find_split_point(const std::vector<providers::Message> &history,
                                           double fraction);

/// Character weight of a message as seen by the split-point search.
[[nodiscard]] std::size_t message_weight(const providers::Message &message);

/// Summarize-and-replace shrinking of the oldest part of a conversation.
class Compressor {
public:
  Compressor(providers::ContentGenerator &generator, CompressorOptions options);

  /// Summarizes everything before the split point with one model call. Without `force`
  /// the call is a no-op after an earlier failed attempt, or while history plus
  /// `pending` (content about to be sent) stays below the threshold.
  [[nodiscard]] CompressionResult compress(const std::vector<providers::Message> &history,
                                           bool force,
                                           const common::CancellationToken &cancel = {},
                                           const std::vector<providers::Message> &pending = {});

  [[nodiscard]] bool has_failed_attempt() const { return failed_attempt_; }
  [[nodiscard]] const std::vector<CompressionRecord> &records() const { return records_; }
  [[nodiscard]] const CompressorOptions &options() const { return options_; }

private:
  CompressionResult finish(CompressionRecord record, bool force,
                           std::optional<std::vector<providers::Message>> history);

  providers::ContentGenerator &generator_;
  CompressorOptions options_;
  bool failed_attempt_ = false;
  std::vector<CompressionRecord> records_;
};

} // namespace drover::context
