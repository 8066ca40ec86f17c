#pragma once

#include "drover/config/schema.hpp"
#include "drover/providers/content.hpp"
#include "drover/security/policy.hpp"
#include "drover/tools/tool.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drover::testing {

/// Defaults with observability silenced.
config::Config test_config();

providers::FunctionCall make_call(std::string name, std::string args_json = "{}",
                                  std::string id = "");

/// One canned model response.
struct ScriptedReply {
  std::vector<std::string> deltas;
  std::vector<providers::FunctionCall> calls;
  std::optional<providers::GeneratorError> error;
  std::chrono::milliseconds delay{0};
  std::optional<std::uint64_t> total_tokens;
};

ScriptedReply text_reply(std::string text);
ScriptedReply calls_reply(std::vector<providers::FunctionCall> calls);
ScriptedReply empty_reply();

/// Plays back queued replies in order; once the queue is empty the fallback repeats.
/// Delays honour cancellation, which ends the reply with a Cancelled error.
class ScriptedGenerator final : public providers::ContentGenerator {
public:
  void push(ScriptedReply reply);
  void set_fallback(ScriptedReply reply);
  void set_embedding(const std::string &text, std::vector<float> embedding);
  void set_embed_failure(bool fail) { embed_fails_ = fail; }

  [[nodiscard]] providers::GenerateResult
  generate_stream(const providers::GenerateRequest &request,
                  const providers::StreamEventCallback &on_event,
                  const common::CancellationToken &cancel) override;

  [[nodiscard]] common::Result<std::vector<float>> embed(const std::string &text) override;

  [[nodiscard]] std::string name() const override { return "scripted"; }

  [[nodiscard]] std::size_t calls() const;
  [[nodiscard]] std::vector<providers::GenerateRequest> requests() const;
  [[nodiscard]] std::size_t embed_calls() const { return embed_calls_.load(); }

private:
  mutable std::mutex mutex_;
  std::deque<ScriptedReply> replies_;
  std::optional<ScriptedReply> fallback_;
  std::vector<providers::GenerateRequest> requests_;
  std::map<std::string, std::vector<float>> embeddings_;
  std::atomic<bool> embed_fails_{false};
  std::atomic<std::size_t> embed_calls_{0};
};

struct RecordedExecution {
  std::string call_id;
  tools::ToolArgs args;
};

/// Tool that records its executions and can block, fail or stream.
class RecordingTool final : public tools::ITool {
public:
  explicit RecordingTool(std::string name, tools::ToolKind kind = tools::ToolKind::Read,
                         std::string schema = R"({"type":"object","properties":{}})");

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return "recording tool"; }
  [[nodiscard]] std::string parameters_schema() const override { return schema_; }
  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;
  [[nodiscard]] tools::ToolKind kind() const override { return kind_; }

  void set_output(std::string output) { output_ = std::move(output); }
  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
  void set_failure(std::optional<std::string> failure) { failure_ = std::move(failure); }

  [[nodiscard]] std::vector<RecordedExecution> executions() const;
  [[nodiscard]] std::size_t execution_count() const;
  [[nodiscard]] std::uint32_t max_concurrent() const { return max_running_.load(); }
  [[nodiscard]] bool was_cancelled() const { return cancelled_.load(); }
  /// Blocks until an execution has started or `timeout` passes.
  bool wait_started(std::chrono::milliseconds timeout) const;

private:
  std::string name_;
  tools::ToolKind kind_;
  std::string schema_;
  std::string output_ = "ok";
  std::chrono::milliseconds delay_{0};
  std::optional<std::string> failure_;

  mutable std::mutex mutex_;
  std::vector<RecordedExecution> executions_;
  std::atomic<std::uint32_t> running_{0};
  std::atomic<std::uint32_t> max_running_{0};
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> started_{false};
};

/// Policy returning fixed decisions per tool name; Allow otherwise.
class FixedPolicy final : public security::IPolicyDecisionProvider {
public:
  void set(const std::string &tool_name, security::PolicyDecision decision);

  [[nodiscard]] security::PolicyDecision decide(const std::string &tool_name,
                                                const tools::ToolArgs &args) override;
  void allow_always(const std::string &tool_name) override;

  [[nodiscard]] std::vector<std::string> always_allowed() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, security::PolicyDecision> decisions_;
  std::vector<std::string> always_allowed_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

} // namespace drover::testing
