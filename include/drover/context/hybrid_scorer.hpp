#pragma once

#include "drover/config/schema.hpp"
#include "drover/context/scorers.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace drover::context {

struct ScoredChunk {
  std::string chunk_id;
  double score = 0.0;
  ScoreBreakdown breakdown;
};

/// Weighted sum of the four relevance signals, clamped to [0,1].
class HybridScorer {
public:
  HybridScorer(config::ScoringWeights weights, RecencyScorer recency,
               EmbeddingScorer *embedding = nullptr, Bm25Scorer bm25 = Bm25Scorer());

  /// One entry per chunk, in input order.
  [[nodiscard]] std::vector<ScoredChunk> score_chunks(const std::vector<ConversationChunk> &chunks,
                                                      std::string_view query, std::int64_t now_ms);

  void update_weights(const config::ScoringWeights &weights) { weights_ = weights; }
  [[nodiscard]] const config::ScoringWeights &weights() const { return weights_; }

private:
  config::ScoringWeights weights_;
  RecencyScorer recency_;
  EmbeddingScorer *embedding_;
  Bm25Scorer bm25_;
};

} // namespace drover::context
