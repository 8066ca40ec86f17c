#include "drover/context/context_manager.hpp"

#include "drover/observability/global.hpp"

#include <algorithm>
#include <cmath>

namespace drover::context {

namespace {

constexpr std::string_view kSystemChunkId = "system-prompt";

std::string chunk_text(const providers::Message &message) {
  std::string text = message.text;
  for (const auto &call : message.function_calls) {
    text += "\n" + call.name + " " + call.args_json;
  }
  if (message.function_response.has_value()) {
    text += "\n" + message.function_response->name + " " + message.function_response->output;
  }
  return text;
}

} // namespace

ContextManagerOptions ContextManagerOptions::from_config(const config::Config &config) {
  ContextManagerOptions options;
  options.compression.threshold = config.context.compression_threshold;
  options.compression.preserve_fraction = config.context.preserve_fraction;
  options.compression.context_window = config.provider.context_window;
  options.weights = config.context.scoring_weights;
  options.recency_half_life_ms = config.context.recency_half_life_ms;
  options.use_embeddings = config.context.use_embeddings;
  return options;
}

std::vector<ConversationChunk> chunks_from_history(const std::vector<providers::Message> &history,
                                                   const std::int64_t now_ms) {
  std::vector<ConversationChunk> chunks;
  chunks.reserve(history.size());
  const auto count = static_cast<std::int64_t>(history.size());
  for (std::int64_t i = 0; i < count; ++i) {
    const auto &message = history[static_cast<std::size_t>(i)];
    ConversationChunk chunk;
    chunk.id = "msg-" + std::to_string(i);
    chunk.role = message.role;
    chunk.content = chunk_text(message);
    chunk.token_count = providers::estimate_tokens(message);
    // Messages carry no clock; spread them a second apart ending now.
    chunk.timestamp_ms = now_ms - (count - 1 - i) * 1000;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

ContextManager::ContextManager(providers::ContentGenerator &generator,
                               ContextManagerOptions options, EmbeddingCache *cache)
    : generator_(generator), options_(options), compressor_(generator, options.compression),
      embedding_(options.use_embeddings ? std::make_unique<EmbeddingScorer>(generator, cache)
                                        : nullptr),
      scorer_(options.weights, RecencyScorer(options.recency_half_life_ms), embedding_.get()),
      pruner_(scorer_) {}

bool ContextManager::needs_compression(const std::vector<providers::Message> &history,
                                       const std::vector<providers::Message> &pending) {
  std::vector<providers::Message> prospective = history;
  prospective.insert(prospective.end(), pending.begin(), pending.end());
  auto counted = generator_.count_tokens(prospective);
  const std::uint64_t tokens =
      counted.ok() ? counted.value() : providers::estimate_tokens(prospective);
  observability::record_metric(observability::ContextTokensMetric{.tokens = tokens});
  const double limit = options_.compression.threshold *
                       static_cast<double>(options_.compression.context_window);
  return static_cast<double>(tokens) > limit;
}

CompressionResult ContextManager::compress(const std::vector<providers::Message> &history,
                                           const bool force,
                                           const common::CancellationToken &cancel,
                                           const std::vector<providers::Message> &pending) {
  return compressor_.compress(history, force, cancel, pending);
}

HistoryPruneResult ContextManager::prune_history(const std::vector<providers::Message> &history,
                                                 const std::optional<std::string> &system_prompt,
                                                 const std::uint64_t token_budget) {
  const std::int64_t now = now_ms();
  auto chunks = chunks_from_history(history, now);

  std::string query;
  bool first_user_marked = false;
  for (std::size_t i = 0; i < history.size(); ++i) {
    const auto &message = history[i];
    if (message.role != providers::Role::User || message.is_function_response()) {
      continue;
    }
    if (!first_user_marked) {
      chunks[i].mandatory = true;
      first_user_marked = true;
    }
    query = message.text;
  }

  if (system_prompt.has_value() && !system_prompt->empty()) {
    ConversationChunk system;
    system.id = std::string(kSystemChunkId);
    system.role = providers::Role::User;
    system.content = *system_prompt;
    system.token_count = providers::estimate_tokens(*system_prompt);
    system.timestamp_ms = now;
    system.mandatory = true;
    system.tags.insert(ChunkTag::System);
    chunks.insert(chunks.begin(), std::move(system));
  }

  auto pruned = pruner_.optimize(chunks, query, token_budget, now);

  std::vector<bool> keep(history.size(), false);
  for (const auto &chunk : pruned.retained) {
    if (chunk.id.rfind("msg-", 0) == 0) {
      keep[std::stoul(chunk.id.substr(4))] = true;
    }
  }

  // A model turn with tool calls and its tool responses survive only as a unit.
  for (std::size_t i = 0; i < history.size(); ++i) {
    if (!history[i].has_function_calls()) {
      continue;
    }
    std::size_t end = i + 1;
    while (end < history.size() && history[end].is_function_response()) {
      ++end;
    }
    bool all = keep[i];
    for (std::size_t j = i + 1; j < end; ++j) {
      all = all && keep[j];
    }
    for (std::size_t j = i; j < end; ++j) {
      keep[j] = all;
    }
    i = end - 1;
  }
  // Tool responses with no surviving call ahead of them.
  for (std::size_t i = 0; i < history.size(); ++i) {
    if (history[i].is_function_response() && keep[i]) {
      std::size_t j = i;
      while (j > 0 && history[j - 1].is_function_response()) {
        --j;
      }
      if (j == 0 || !keep[j - 1] || !history[j - 1].has_function_calls()) {
        keep[i] = false;
      }
    }
  }

  HistoryPruneResult result;
  for (std::size_t i = 0; i < history.size(); ++i) {
    if (keep[i]) {
      result.history.push_back(history[i]);
    }
  }
  result.stats = pruned.stats;
  const bool has_system = chunks.size() > history.size();
  result.stats.retained_chunks = result.history.size() + (has_system ? 1 : 0);
  result.stats.retained_tokens = providers::estimate_tokens(result.history) +
                                 (has_system ? chunks.front().token_count : 0);
  const auto original = result.stats.original_tokens;
  const auto removed = original - std::min(original, result.stats.retained_tokens);
  result.stats.reduction_percentage =
      original == 0 ? 0
                    : static_cast<std::uint32_t>(std::lround(
                          static_cast<double>(removed) / static_cast<double>(original) * 100.0));
  observability::record_prune(original, result.stats.retained_tokens,
                              result.stats.reduction_percentage);
  return result;
}

} // namespace drover::context
