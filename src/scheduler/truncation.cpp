#include "drover/scheduler/truncation.hpp"

#include "drover/common/fs.hpp"
#include "drover/observability/global.hpp"

#include <algorithm>

namespace drover::scheduler {

namespace {

// Backs off so the cut does not land inside a UTF-8 sequence.
std::size_t utf8_boundary(const std::string &text, std::size_t pos) {
  while (pos > 0 && pos < text.size() &&
         (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
    --pos;
  }
  return pos;
}

std::string safe_file_name(const std::string &call_id) {
  std::string out;
  out.reserve(call_id.size());
  for (const char ch : call_id) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.';
    out.push_back(ok ? ch : '_');
  }
  if (out.empty() || out == "." || out == "..") {
    out = "call";
  }
  return out;
}

} // namespace

TruncationOptions TruncationOptions::from_config(const config::SchedulerConfig &config) {
  TruncationOptions options;
  options.max_bytes = config.truncate_output_bytes;
  options.max_lines = config.truncate_output_lines;
  if (!config.output_dir.empty()) {
    options.output_dir = common::expand_path(config.output_dir);
  }
  return options;
}

TruncatedOutput truncate_tool_output(const std::string &call_id, const std::string &output,
                                     const TruncationOptions &options) {
  TruncatedOutput out;
  std::size_t keep = output.size();

  if (options.max_lines > 0) {
    std::size_t lines = 0;
    for (std::size_t i = 0; i < output.size(); ++i) {
      if (output[i] == '\n' && ++lines == options.max_lines) {
        keep = std::min(keep, i + 1);
        break;
      }
    }
  }
  if (options.max_bytes > 0 && keep > options.max_bytes) {
    keep = utf8_boundary(output, static_cast<std::size_t>(options.max_bytes));
  }

  if (keep >= output.size()) {
    out.text = output;
    return out;
  }

  out.truncated = true;
  out.omitted_bytes = output.size() - keep;
  out.text = output.substr(0, keep);
  if (!out.text.empty() && out.text.back() != '\n') {
    out.text.push_back('\n');
  }
  out.text += "[output truncated: " + std::to_string(out.omitted_bytes) + " bytes omitted]";

  if (!options.output_dir.empty()) {
    const auto path = options.output_dir / (safe_file_name(call_id) + ".output");
    const auto written = common::write_text_file(path, output);
    if (written.ok()) {
      out.output_file = path.string();
    } else {
      observability::log_warn("scheduler", "could not persist full output for " + call_id +
                                               ": " + written.error());
    }
  }
  return out;
}

} // namespace drover::scheduler
