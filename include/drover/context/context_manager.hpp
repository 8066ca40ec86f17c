#pragma once

#include "drover/config/schema.hpp"
#include "drover/context/compressor.hpp"
#include "drover/context/embedding_cache.hpp"
#include "drover/context/hybrid_scorer.hpp"
#include "drover/context/relevance_pruner.hpp"
#include "drover/providers/content.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace drover::context {

struct ContextManagerOptions {
  CompressorOptions compression;
  config::ScoringWeights weights;
  std::uint64_t recency_half_life_ms = 600'000;
  bool use_embeddings = false;

  [[nodiscard]] static ContextManagerOptions from_config(const config::Config &config);
};

struct HistoryPruneResult {
  std::vector<providers::Message> history;
  PruneStats stats;
};

/// Owns the session's shrinking machinery. It never touches history itself: callers
/// hand in a snapshot and splice the result back.
class ContextManager {
public:
  ContextManager(providers::ContentGenerator &generator, ContextManagerOptions options,
                 EmbeddingCache *cache = nullptr);

  /// True when history plus `pending` would exceed the compression threshold.
  [[nodiscard]] bool needs_compression(const std::vector<providers::Message> &history,
                                       const std::vector<providers::Message> &pending);

  [[nodiscard]] CompressionResult compress(const std::vector<providers::Message> &history,
                                           bool force,
                                           const common::CancellationToken &cancel = {},
                                           const std::vector<providers::Message> &pending = {});

  /// Prunes `history` to `token_budget` using the latest user message as the query.
  /// The first user message and the system prompt are never dropped, and a model turn
  /// with tool calls is kept or dropped together with its tool responses.
  [[nodiscard]] HistoryPruneResult prune_history(const std::vector<providers::Message> &history,
                                                 const std::optional<std::string> &system_prompt,
                                                 std::uint64_t token_budget);

  [[nodiscard]] Compressor &compressor() { return compressor_; }
  [[nodiscard]] RelevancePruner &pruner() { return pruner_; }
  [[nodiscard]] HybridScorer &scorer() { return scorer_; }

private:
  providers::ContentGenerator &generator_;
  ContextManagerOptions options_;
  Compressor compressor_;
  std::unique_ptr<EmbeddingScorer> embedding_;
  HybridScorer scorer_;
  RelevancePruner pruner_;
};

/// One chunk per message; ids are "msg-<index>".
[[nodiscard]] std::vector<ConversationChunk>
chunks_from_history(const std::vector<providers::Message> &history, std::int64_t now_ms);

} // namespace drover::context
