#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace drover::config {

struct ProviderConfig {
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "gpt-4o-mini";
  std::optional<std::string> api_key;
  double temperature = 0.7;
  std::uint32_t max_output_tokens = 4096;
  std::uint64_t context_window = 128'000;
  std::uint32_t max_retries = 3;
  std::uint64_t backoff_ms = 500;
  std::uint64_t timeout_ms = 120'000;
  std::string embedding_model = "text-embedding-3-small";
  std::size_t embedding_dimensions = 1536;
};

/// Relative weights of the pruning signals; they need not sum to 1.
struct ScoringWeights {
  double bm25 = 0.4;
  double embedding = 0.4;
  double recency = 0.15;
  double manual = 0.05;
};

struct AgentConfig {
  std::uint32_t max_turns = 50;
  std::uint64_t timeout_ms = 600'000;
  std::uint64_t grace_fixed_ms = 60'000;
  std::uint64_t min_useful_recovery_ms = 5'000;
  std::uint32_t tool_parallelism = 1;
  std::uint32_t autonomous_tool_parallelism = 4;
  double time_warning_fraction = 0.8;
};

struct ContextConfig {
  double compression_threshold = 0.2;
  double preserve_fraction = 0.3;
  std::uint64_t token_budget = 0;
  std::uint64_t recency_half_life_ms = 600'000;
  bool use_embeddings = false;
  std::string embedding_cache_path;
  ScoringWeights scoring_weights;
};

struct LoopDetectionConfig {
  bool enabled = true;
  std::uint32_t max_tool_call_loop = 5;
  std::uint32_t max_content_loop = 10;
  std::uint32_t content_chunk_size = 50;
  std::uint32_t max_history_length = 5'000;
};

struct SchedulerConfig {
  std::uint64_t truncate_output_bytes = 1024 * 1024;
  std::uint32_t truncate_output_lines = 1000;
  std::string output_dir;
};

struct SecurityConfig {
  std::string approval_mode = "default";
  std::vector<std::string> allow;
  std::vector<std::string> deny;
  std::vector<std::string> ask;
  bool interactive = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "warn";
};

struct Config {
  ProviderConfig provider;
  AgentConfig agent;
  ContextConfig context;
  LoopDetectionConfig loop_detection;
  SchedulerConfig scheduler;
  SecurityConfig security;
  ObservabilityConfig observability;
};

} // namespace drover::config
