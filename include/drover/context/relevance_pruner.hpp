#pragma once

#include "drover/context/chunk.hpp"
#include "drover/context/hybrid_scorer.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace drover::context {

struct PruneStats {
  std::size_t original_chunks = 0;
  std::size_t retained_chunks = 0;
  std::uint64_t original_tokens = 0;
  std::uint64_t retained_tokens = 0;
  /// Share of tokens removed, rounded to a whole percent.
  std::uint32_t reduction_percentage = 0;
  std::uint32_t chunk_reduction_percentage = 0;
  std::size_t orphans_dropped = 0;
  double processing_time_ms = 0.0;
  ScoreBreakdown average_scores;
  std::vector<ScoredChunk> top_chunks;
};

struct PruneResult {
  /// Kept chunks in their original conversation order.
  std::vector<ConversationChunk> retained;
  PruneStats stats;
};

/// Score-and-select under a token budget.
class RelevancePruner {
public:
  explicit RelevancePruner(HybridScorer &scorer, std::size_t top_n = 5);

  /// Scores every prunable chunk against `query`, then selects with prune().
  [[nodiscard]] PruneResult optimize(const std::vector<ConversationChunk> &chunks,
                                     std::string_view query, std::uint64_t token_budget,
                                     std::int64_t now_ms);

  /// Selects using the scores already on the chunks (a missing score counts as 0).
  /// Must-keep chunks go first, then the best score-per-token ratios that still fit;
  /// a response whose originating user turn did not make it is dropped.
  [[nodiscard]] PruneResult prune(const std::vector<ConversationChunk> &chunks,
                                  std::uint64_t token_budget) const;

  [[nodiscard]] HybridScorer &scorer() { return scorer_; }

private:
  HybridScorer &scorer_;
  std::size_t top_n_;
};

} // namespace drover::context
