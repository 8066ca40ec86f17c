#include "drover/context/relevance_pruner.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <optional>
#include <unordered_map>

namespace drover::context {

namespace {

std::uint32_t percent(const std::uint64_t removed, const std::uint64_t original) {
  if (original == 0) {
    return 0;
  }
  return static_cast<std::uint32_t>(
      std::lround(static_cast<double>(removed) / static_cast<double>(original) * 100.0));
}

bool is_response(const ConversationChunk &chunk) {
  return chunk.role == providers::Role::Model || chunk.role == providers::Role::Tool;
}

void fill_totals(PruneResult &result, const std::vector<ConversationChunk> &chunks) {
  auto &stats = result.stats;
  stats.original_chunks = chunks.size();
  stats.original_tokens = total_tokens(chunks);
  stats.retained_chunks = result.retained.size();
  stats.retained_tokens = total_tokens(result.retained);
  stats.reduction_percentage =
      percent(stats.original_tokens - std::min(stats.original_tokens, stats.retained_tokens),
              stats.original_tokens);
  stats.chunk_reduction_percentage =
      percent(stats.original_chunks - stats.retained_chunks, stats.original_chunks);
}

} // namespace

RelevancePruner::RelevancePruner(HybridScorer &scorer, const std::size_t top_n)
    : scorer_(scorer), top_n_(top_n) {}

PruneResult RelevancePruner::optimize(const std::vector<ConversationChunk> &chunks,
                                      std::string_view query, const std::uint64_t token_budget,
                                      const std::int64_t now_ms) {
  const auto started = std::chrono::steady_clock::now();

  if (token_budget == 0 || total_tokens(chunks) <= token_budget) {
    return prune(chunks, token_budget);
  }

  std::vector<ConversationChunk> candidates;
  for (const auto &chunk : chunks) {
    if (!chunk.must_keep()) {
      candidates.push_back(chunk);
    }
  }
  const auto scored = scorer_.score_chunks(candidates, query, now_ms);
  std::unordered_map<std::string, const ScoredChunk *> by_id;
  for (const auto &entry : scored) {
    by_id[entry.chunk_id] = &entry;
  }

  std::vector<ConversationChunk> annotated = chunks;
  for (auto &chunk : annotated) {
    const auto it = by_id.find(chunk.id);
    if (it != by_id.end()) {
      chunk.score = it->second->score;
      chunk.breakdown = it->second->breakdown;
    }
  }

  PruneResult result = prune(annotated, token_budget);

  if (!scored.empty()) {
    ScoreBreakdown sum;
    for (const auto &entry : scored) {
      sum.bm25 += entry.breakdown.bm25;
      sum.embedding += entry.breakdown.embedding;
      sum.recency += entry.breakdown.recency;
      sum.manual += entry.breakdown.manual;
    }
    const double n = static_cast<double>(scored.size());
    result.stats.average_scores =
        ScoreBreakdown{sum.bm25 / n, sum.embedding / n, sum.recency / n, sum.manual / n};

    auto top = scored;
    std::stable_sort(top.begin(), top.end(),
                     [](const ScoredChunk &lhs, const ScoredChunk &rhs) {
                       return lhs.score > rhs.score;
                     });
    if (top.size() > top_n_) {
      top.resize(top_n_);
    }
    result.stats.top_chunks = std::move(top);
  }

  result.stats.processing_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  return result;
}

PruneResult RelevancePruner::prune(const std::vector<ConversationChunk> &chunks,
                                   const std::uint64_t token_budget) const {
  const auto started = std::chrono::steady_clock::now();
  PruneResult result;

  if (token_budget == 0 || chunks.empty()) {
    fill_totals(result, chunks);
    if (!chunks.empty()) {
      result.stats.reduction_percentage = 100;
      result.stats.chunk_reduction_percentage = 100;
    }
    return result;
  }
  if (total_tokens(chunks) <= token_budget) {
    result.retained = chunks;
    fill_totals(result, chunks);
    return result;
  }

  std::vector<bool> keep(chunks.size(), false);
  std::uint64_t used = 0;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].must_keep()) {
      keep[i] = true;
      used += chunks[i].token_count;
    }
  }

  std::vector<std::size_t> order;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (!keep[i]) {
      order.push_back(i);
    }
  }
  const auto ratio = [&chunks](const std::size_t index) {
    const auto &chunk = chunks[index];
    if (chunk.token_count == 0) {
      return std::numeric_limits<double>::infinity();
    }
    return chunk.score.value_or(0.0) / static_cast<double>(chunk.token_count);
  };
  std::stable_sort(order.begin(), order.end(),
                   [&ratio](const std::size_t lhs, const std::size_t rhs) {
                     return ratio(lhs) > ratio(rhs);
                   });

  for (const std::size_t index : order) {
    const std::uint64_t cost = chunks[index].token_count;
    if (used + cost <= token_budget) {
      keep[index] = true;
      used += cost;
    }
  }

  // Each response belongs to the closest user turn before it.
  std::optional<std::size_t> originating_user;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto &chunk = chunks[i];
    if (chunk.role == providers::Role::User) {
      originating_user = i;
      continue;
    }
    if (!keep[i] || chunk.must_keep() || !is_response(chunk)) {
      continue;
    }
    if (!originating_user.has_value() || !keep[*originating_user]) {
      keep[i] = false;
      ++result.stats.orphans_dropped;
    }
  }

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (keep[i]) {
      result.retained.push_back(chunks[i]);
    }
  }
  fill_totals(result, chunks);
  result.stats.processing_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  return result;
}

} // namespace drover::context
