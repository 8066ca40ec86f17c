#pragma once

#include "drover/config/schema.hpp"
#include "drover/providers/content.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace drover::agent {

enum class LoopKind { None, ToolCall, Content };

[[nodiscard]] std::string_view loop_kind_name(LoopKind kind);

struct LoopCheckResult {
  bool detected = false;
  LoopKind kind = LoopKind::None;
  std::uint32_t count = 0;
  std::string detail;
};

struct LoopDetectorOptions {
  bool enabled = true;
  std::uint32_t max_tool_call_loop = 5;
  std::uint32_t max_content_loop = 10;
  std::uint32_t content_chunk_size = 50;
  std::uint32_t max_history_length = 5'000;

  [[nodiscard]] static LoopDetectorOptions from_config(const config::LoopDetectionConfig &config);
};

/// Watches one prompt's event stream for repeated tool calls and chanting text.
/// Once a loop is seen the result stays latched until reset().
class LoopDetector {
public:
  explicit LoopDetector(LoopDetectorOptions options = {});

  void reset(const std::string &prompt_id);
  void disable_for_session() { disabled_ = true; }

  LoopCheckResult add_tool_call(const providers::FunctionCall &call);
  LoopCheckResult add_content(std::string_view text);

  [[nodiscard]] bool loop_detected() const { return latched_.detected; }
  [[nodiscard]] const std::string &prompt_id() const { return prompt_id_; }

private:
  [[nodiscard]] bool check_tool_call(const std::string &key);
  [[nodiscard]] bool check_content(std::string_view text);
  void reset_content_tracking();
  void truncate_history();
  [[nodiscard]] bool analyze_chunks();
  [[nodiscard]] bool chunk_repeats(const std::string &chunk, const std::string &hash);
  LoopCheckResult latch(LoopKind kind, std::string detail);

  LoopDetectorOptions options_;
  std::string prompt_id_;
  bool disabled_ = false;

  std::string last_tool_key_;
  std::uint32_t tool_repetitions_ = 0;

  std::string content_history_;
  std::unordered_map<std::string, std::vector<std::size_t>> content_stats_;
  std::size_t content_index_ = 0;
  bool in_code_block_ = false;

  LoopCheckResult latched_;
};

} // namespace drover::agent
