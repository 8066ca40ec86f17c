#pragma once

#include "drover/providers/content.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace drover::context {

enum class ChunkTag { Pinned, System, ToolDefinition };

[[nodiscard]] std::string_view chunk_tag_name(ChunkTag tag);

struct ScoreBreakdown {
  double bm25 = 0.0;
  double embedding = 0.0;
  double recency = 0.0;
  double manual = 0.0;
};

/// One prunable unit of conversation history.
struct ConversationChunk {
  std::string id;
  providers::Role role = providers::Role::User;
  std::string content;
  std::uint64_t token_count = 0;
  /// Milliseconds since the epoch.
  std::int64_t timestamp_ms = 0;
  bool mandatory = false;
  std::set<ChunkTag> tags;
  /// Pin strength in [0,1]; pinned chunks count as 1.
  double manual_weight = 0.0;
  std::optional<double> score;
  ScoreBreakdown breakdown;

  [[nodiscard]] bool has_tag(ChunkTag tag) const { return tags.contains(tag); }
  /// Mandatory, pinned, system and tool-definition chunks survive pruning regardless of score.
  [[nodiscard]] bool must_keep() const {
    return mandatory || has_tag(ChunkTag::Pinned) || has_tag(ChunkTag::System) ||
           has_tag(ChunkTag::ToolDefinition);
  }
};

[[nodiscard]] std::uint64_t total_tokens(const std::vector<ConversationChunk> &chunks);

[[nodiscard]] std::int64_t now_ms();

} // namespace drover::context
