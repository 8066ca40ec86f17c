#pragma once

#include "drover/context/chunk.hpp"
#include "drover/context/embedding_cache.hpp"
#include "drover/providers/content.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace drover::context {

/// Chunk id to signal value in [0,1].
using ChunkScores = std::unordered_map<std::string, double>;

[[nodiscard]] std::vector<std::string> tokenize(std::string_view text);
[[nodiscard]] double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

/// Okapi BM25 over the chunk set, normalized by the best-scoring chunk.
class Bm25Scorer {
public:
  explicit Bm25Scorer(double k1 = 1.2, double b = 0.75) : k1_(k1), b_(b) {}

  [[nodiscard]] ChunkScores score(const std::vector<ConversationChunk> &chunks,
                                  std::string_view query) const;

private:
  double k1_;
  double b_;
};

/// Exponential decay: a chunk `half_life_ms` old scores 0.5.
class RecencyScorer {
public:
  explicit RecencyScorer(std::uint64_t half_life_ms = 600'000) : half_life_ms_(half_life_ms) {}

  [[nodiscard]] ChunkScores score(const std::vector<ConversationChunk> &chunks,
                                  std::int64_t now_ms) const;

private:
  std::uint64_t half_life_ms_;
};

/// Cosine similarity between chunk and query embeddings, negative values clamped to 0.
/// Any embedding failure degrades that chunk (or, for the query, every chunk) to 0.
class EmbeddingScorer {
public:
  EmbeddingScorer(providers::ContentGenerator &generator, EmbeddingCache *cache = nullptr);

  [[nodiscard]] ChunkScores score(const std::vector<ConversationChunk> &chunks,
                                  std::string_view query);

  [[nodiscard]] std::size_t embed_calls() const { return embed_calls_; }

private:
  [[nodiscard]] common::Result<std::vector<float>> embedding_for(const std::string &text);

  providers::ContentGenerator &generator_;
  EmbeddingCache *cache_;
  std::size_t embed_calls_ = 0;
};

} // namespace drover::context
