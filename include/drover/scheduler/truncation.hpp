#pragma once

#include "drover/config/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace drover::scheduler {

struct TruncationOptions {
  std::uint64_t max_bytes = 1024 * 1024;
  std::uint32_t max_lines = 1000;
  /// Where full outputs are written; empty disables the sink.
  std::filesystem::path output_dir;

  [[nodiscard]] static TruncationOptions from_config(const config::SchedulerConfig &config);
};

struct TruncatedOutput {
  std::string text;
  bool truncated = false;
  std::uint64_t omitted_bytes = 0;
  std::optional<std::string> output_file;
};

/// Caps `output` by lines and bytes, appending `[output truncated: N bytes omitted]`.
/// A failing sink write is logged and leaves `output_file` empty.
[[nodiscard]] TruncatedOutput truncate_tool_output(const std::string &call_id,
                                                   const std::string &output,
                                                   const TruncationOptions &options);

} // namespace drover::scheduler
