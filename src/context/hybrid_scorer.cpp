#include "drover/context/hybrid_scorer.hpp"

#include <algorithm>

namespace drover::context {

namespace {

double lookup(const ChunkScores &scores, const std::string &id) {
  const auto it = scores.find(id);
  return it == scores.end() ? 0.0 : std::max(0.0, it->second);
}

} // namespace

HybridScorer::HybridScorer(config::ScoringWeights weights, RecencyScorer recency,
                           EmbeddingScorer *embedding, Bm25Scorer bm25)
    : weights_(weights), recency_(recency), embedding_(embedding), bm25_(bm25) {}

std::vector<ScoredChunk> HybridScorer::score_chunks(const std::vector<ConversationChunk> &chunks,
                                                    std::string_view query,
                                                    const std::int64_t now_ms) {
  std::vector<ScoredChunk> out;
  if (chunks.empty()) {
    return out;
  }

  const ChunkScores bm25 = bm25_.score(chunks, query);
  const ChunkScores recency = recency_.score(chunks, now_ms);
  ChunkScores embedding;
  if (embedding_ != nullptr && weights_.embedding > 0.0) {
    embedding = embedding_->score(chunks, query);
  }

  out.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    ScoredChunk scored;
    scored.chunk_id = chunk.id;
    scored.breakdown.bm25 = lookup(bm25, chunk.id);
    scored.breakdown.embedding = lookup(embedding, chunk.id);
    scored.breakdown.recency = lookup(recency, chunk.id);
    scored.breakdown.manual =
        chunk.has_tag(ChunkTag::Pinned) ? 1.0 : std::clamp(chunk.manual_weight, 0.0, 1.0);

    const double combined = weights_.bm25 * scored.breakdown.bm25 +
                            weights_.embedding * scored.breakdown.embedding +
                            weights_.recency * scored.breakdown.recency +
                            weights_.manual * scored.breakdown.manual;
    scored.score = std::clamp(combined, 0.0, 1.0);
    out.push_back(std::move(scored));
  }
  return out;
}

} // namespace drover::context
