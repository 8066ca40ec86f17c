#include "drover/agent/loop_detector.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/hash.hpp"
#include "drover/observability/global.hpp"
#include "drover/tools/tool.hpp"

#include <algorithm>
#include <set>

namespace drover::agent {

namespace {

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string_view ltrim(std::string_view line) {
  while (!line.empty() && (line.front() == ' ' || line.front() == '\t' || line.front() == '\r')) {
    line.remove_prefix(1);
  }
  return line;
}

bool is_space(const char ch) { return ch == ' ' || ch == '\t' || ch == '\r'; }

std::size_t count_fences(std::string_view text) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while ((pos = text.find("```", pos)) != std::string_view::npos) {
    ++count;
    pos += 3;
  }
  return count;
}

bool is_table_line(std::string_view line) {
  line = ltrim(line);
  if (line.empty()) {
    return false;
  }
  if (line.front() == '|' && line.find('|', 1) != std::string_view::npos) {
    return true;
  }
  std::size_t run = 0;
  for (const char ch : line) {
    if (ch != '|' && ch != '+' && ch != '-') {
      break;
    }
    ++run;
  }
  return run >= 3;
}

bool is_list_line(std::string_view line) {
  line = ltrim(line);
  if (line.size() >= 2 && (line[0] == '*' || line[0] == '-' || line[0] == '+') &&
      is_space(line[1])) {
    return true;
  }
  std::size_t digits = 0;
  while (digits < line.size() && line[digits] >= '0' && line[digits] <= '9') {
    ++digits;
  }
  return digits > 0 && digits + 1 < line.size() && line[digits] == '.' &&
         is_space(line[digits + 1]);
}

bool is_heading_line(std::string_view line) {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  return hashes > 0 && hashes < line.size() && is_space(line[hashes]);
}

bool is_blockquote_line(std::string_view line) {
  return line.size() >= 2 && line[0] == '>' && is_space(line[1]);
}

// Only rule characters: + - _ = * and box-drawing glyphs (U+2500..U+257F).
bool is_divider(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  std::size_t i = 0;
  while (i < text.size()) {
    const auto ch = static_cast<unsigned char>(text[i]);
    if (ch == '+' || ch == '-' || ch == '_' || ch == '=' || ch == '*') {
      ++i;
      continue;
    }
    if (ch == 0xE2 && i + 2 < text.size() &&
        (static_cast<unsigned char>(text[i + 1]) == 0x94 ||
         static_cast<unsigned char>(text[i + 1]) == 0x95)) {
      i += 3;
      continue;
    }
    return false;
  }
  return true;
}

bool has_structured_markup(std::string_view text) {
  for (const auto line : split_lines(text)) {
    if (is_table_line(line) || is_list_line(line) || is_heading_line(line) ||
        is_blockquote_line(line)) {
      return true;
    }
  }
  return false;
}

std::string canonical_args(const std::string &args_json) {
  auto parsed = tools::parse_tool_args(args_json);
  if (!parsed.ok()) {
    return args_json;
  }
  return tools::serialize_tool_args(parsed.value());
}

} // namespace

std::string_view loop_kind_name(const LoopKind kind) {
  switch (kind) {
  case LoopKind::None:
    return "none";
  case LoopKind::ToolCall:
    return "consecutive_identical_tool_calls";
  case LoopKind::Content:
    return "chanting_identical_sentences";
  }
  return "none";
}

LoopDetectorOptions LoopDetectorOptions::from_config(const config::LoopDetectionConfig &config) {
  return LoopDetectorOptions{.enabled = config.enabled,
                             .max_tool_call_loop = config.max_tool_call_loop,
                             .max_content_loop = config.max_content_loop,
                             .content_chunk_size = config.content_chunk_size,
                             .max_history_length = config.max_history_length};
}

LoopDetector::LoopDetector(LoopDetectorOptions options) : options_(options) {}

void LoopDetector::reset(const std::string &prompt_id) {
  prompt_id_ = prompt_id;
  last_tool_key_.clear();
  tool_repetitions_ = 0;
  reset_content_tracking();
  in_code_block_ = false;
  latched_ = LoopCheckResult{};
}

LoopCheckResult LoopDetector::add_tool_call(const providers::FunctionCall &call) {
  if (disabled_ || !options_.enabled) {
    return {};
  }
  if (latched_.detected) {
    return latched_;
  }
  reset_content_tracking();
  const std::string args = canonical_args(call.args_json);
  if (check_tool_call(common::sha256_hex(call.name + ":" + args))) {
    return latch(LoopKind::ToolCall, "Repeated tool call: " + call.name + " with arguments " + args);
  }
  return {};
}

LoopCheckResult LoopDetector::add_content(std::string_view text) {
  if (disabled_ || !options_.enabled) {
    return {};
  }
  if (latched_.detected) {
    return latched_;
  }
  if (check_content(text)) {
    const std::size_t from = content_index_ >= 20 ? content_index_ - 20 : 0;
    const std::string excerpt = content_history_.substr(
        from, content_index_ - from + options_.content_chunk_size);
    return latch(LoopKind::Content,
                 "Repeating content detected: \"" + common::trim(excerpt) + "...\"");
  }
  return {};
}

LoopCheckResult LoopDetector::latch(const LoopKind kind, std::string detail) {
  latched_.detected = true;
  latched_.kind = kind;
  latched_.count += 1;
  latched_.detail = std::move(detail);
  observability::record_loop_detected(std::string(loop_kind_name(kind)), latched_.detail);
  return latched_;
}

bool LoopDetector::check_tool_call(const std::string &key) {
  if (key == last_tool_key_) {
    ++tool_repetitions_;
  } else {
    last_tool_key_ = key;
    tool_repetitions_ = 1;
  }
  return tool_repetitions_ >= options_.max_tool_call_loop;
}

bool LoopDetector::check_content(std::string_view text) {
  const std::size_t fences = count_fences(text);
  const bool divider = is_divider(text);
  if (fences > 0 || divider || has_structured_markup(text)) {
    reset_content_tracking();
  }

  const bool was_in_code_block = in_code_block_;
  if (fences % 2 == 1) {
    in_code_block_ = !in_code_block_;
  }
  if (was_in_code_block || in_code_block_ || divider) {
    return false;
  }

  content_history_.append(text);
  truncate_history();
  return analyze_chunks();
}

void LoopDetector::reset_content_tracking() {
  content_history_.clear();
  content_stats_.clear();
  content_index_ = 0;
}

void LoopDetector::truncate_history() {
  if (content_history_.size() <= options_.max_history_length) {
    return;
  }
  const std::size_t cut = content_history_.size() - options_.max_history_length;
  content_history_.erase(0, cut);
  content_index_ = content_index_ > cut ? content_index_ - cut : 0;

  for (auto it = content_stats_.begin(); it != content_stats_.end();) {
    std::vector<std::size_t> kept;
    for (const auto index : it->second) {
      if (index >= cut) {
        kept.push_back(index - cut);
      }
    }
    if (kept.empty()) {
      it = content_stats_.erase(it);
    } else {
      it->second = std::move(kept);
      ++it;
    }
  }
}

bool LoopDetector::analyze_chunks() {
  const std::size_t chunk_size = options_.content_chunk_size;
  while (content_index_ + chunk_size <= content_history_.size()) {
    const std::string chunk = content_history_.substr(content_index_, chunk_size);
    if (chunk_repeats(chunk, common::sha256_hex(chunk))) {
      return true;
    }
    ++content_index_;
  }
  return false;
}

bool LoopDetector::chunk_repeats(const std::string &chunk, const std::string &hash) {
  auto it = content_stats_.find(hash);
  if (it == content_stats_.end()) {
    content_stats_.emplace(hash, std::vector<std::size_t>{content_index_});
    return false;
  }
  auto &indices = it->second;
  if (content_history_.compare(indices.front(), options_.content_chunk_size, chunk) != 0) {
    return false;
  }
  indices.push_back(content_index_);

  const std::size_t threshold = std::max<std::size_t>(2, options_.max_content_loop);
  if (indices.size() < threshold) {
    return false;
  }

  const std::vector<std::size_t> recent(indices.end() - static_cast<std::ptrdiff_t>(threshold),
                                        indices.end());
  const double average =
      static_cast<double>(recent.back() - recent.front()) / static_cast<double>(threshold - 1);
  if (average > static_cast<double>(options_.content_chunk_size) * 5.0) {
    return false;
  }

  std::set<std::string> periods;
  for (std::size_t i = 0; i + 1 < recent.size(); ++i) {
    periods.insert(content_history_.substr(recent[i], recent[i + 1] - recent[i]));
  }
  return periods.size() <= threshold / 2;
}

} // namespace drover::agent
