#include "drover/context/chunk.hpp"

#include <chrono>

namespace drover::context {

std::string_view chunk_tag_name(const ChunkTag tag) {
  switch (tag) {
  case ChunkTag::Pinned:
    return "pinned";
  case ChunkTag::System:
    return "system";
  case ChunkTag::ToolDefinition:
    return "tool-def";
  }
  return "pinned";
}

std::uint64_t total_tokens(const std::vector<ConversationChunk> &chunks) {
  std::uint64_t total = 0;
  for (const auto &chunk : chunks) {
    total += chunk.token_count;
  }
  return total;
}

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace drover::context
