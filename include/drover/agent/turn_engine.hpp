#pragma once

#include "drover/common/cancellation.hpp"
#include "drover/common/channel.hpp"
#include "drover/context/context_manager.hpp"
#include "drover/providers/content.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace drover::agent {

enum class TurnEventKind { Delta, ToolCallRequested, Retry, Compressed, TurnComplete, Error };

[[nodiscard]] std::string_view turn_event_kind_name(TurnEventKind kind);

struct TurnEvent {
  TurnEventKind kind = TurnEventKind::Delta;
  /// Delta text or error message.
  std::string text;
  providers::FunctionCall call;
  providers::GenerateSummary summary;
  std::uint32_t attempt = 0;
  bool cancelled = false;
  std::optional<context::CompressionRecord> compression;
};

/// Everything one turn produced, gathered from its stream.
struct TurnOutcome {
  std::string text;
  std::vector<providers::FunctionCall> calls;
  std::optional<std::uint64_t> total_tokens;
  std::uint32_t attempts = 0;
  std::optional<std::string> error;
  bool cancelled = false;
  bool completed = false;
};

/// Consumer end of one turn. Events arrive in order; the stream ends after
/// TurnComplete or Error.
class TurnStream {
public:
  explicit TurnStream(std::shared_ptr<common::Channel<TurnEvent>> channel)
      : channel_(std::move(channel)) {}

  /// Blocks for the next event; std::nullopt once the turn is over.
  [[nodiscard]] std::optional<TurnEvent> next() { return channel_->pop(); }

  /// Drains the stream, forwarding each event to `on_event` when given.
  TurnOutcome collect(const std::function<void(const TurnEvent &)> &on_event = {});

private:
  std::shared_ptr<common::Channel<TurnEvent>> channel_;
};

struct TurnEngineOptions {
  std::string agent_id = "main";
  std::optional<std::string> system_prompt;
  std::vector<providers::ToolDeclaration> tools;
  double temperature = 0.7;
  std::optional<std::uint32_t> max_output_tokens;
  /// Retries after the first attempt for empty or malformed output.
  std::uint32_t max_invalid_retries = 2;
  double temperature_step = 0.3;
  double max_temperature = 2.0;
};

/// Single owner of a session's history. Turns are queued and run one at a time on a
/// private thread, so history has exactly one writer.
class TurnEngine {
public:
  TurnEngine(providers::ContentGenerator &generator, context::ContextManager *context,
             TurnEngineOptions options);
  ~TurnEngine();

  TurnEngine(const TurnEngine &) = delete;
  TurnEngine &operator=(const TurnEngine &) = delete;

  /// Queues `new_content` as the next turn and returns its event stream immediately.
  [[nodiscard]] TurnStream send_turn(std::vector<providers::Message> new_content,
                                     common::CancellationToken cancel = {});

  /// Validated turns only; what the model sees next time.
  [[nodiscard]] std::vector<providers::Message> curated_history() const;
  /// Everything sent and received, including rejected output.
  [[nodiscard]] std::vector<providers::Message> comprehensive_history() const;
  /// Replaces both histories, e.g. with a pruned snapshot. Call between turns.
  void replace_history(std::vector<providers::Message> history);
  /// Appends to both histories, e.g. tool responses that end a run. Call between turns.
  void append_history(const std::vector<providers::Message> &messages);

  void set_system_prompt(std::optional<std::string> prompt);
  void set_tools(std::vector<providers::ToolDeclaration> tools);
  [[nodiscard]] const std::optional<std::string> &system_prompt() const {
    return options_.system_prompt;
  }

  [[nodiscard]] std::uint64_t turns_completed() const { return turns_completed_.load(); }

private:
  struct PendingTurn {
    std::vector<providers::Message> content;
    common::CancellationToken cancel;
    std::shared_ptr<common::Channel<TurnEvent>> events;
  };

  void worker_loop();
  void run_turn(PendingTurn &turn);
  void maybe_compress(PendingTurn &turn);

  providers::ContentGenerator &generator_;
  context::ContextManager *context_;
  TurnEngineOptions options_;

  mutable std::mutex history_mutex_;
  std::vector<providers::Message> curated_;
  std::vector<providers::Message> comprehensive_;

  std::atomic<std::uint64_t> turns_completed_{0};
  std::atomic<bool> stopping_{false};
  common::Channel<PendingTurn> requests_;
  std::thread worker_;
};

/// A model message is valid with non-empty text, at least one named tool call, or when
/// it is a thought.
[[nodiscard]] bool is_valid_model_message(const providers::Message &message);

} // namespace drover::agent
