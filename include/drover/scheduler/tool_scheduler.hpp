#pragma once

#include "drover/bus/message_bus.hpp"
#include "drover/common/cancellation.hpp"
#include "drover/scheduler/executor.hpp"
#include "drover/scheduler/tool_call.hpp"
#include "drover/scheduler/truncation.hpp"
#include "drover/security/policy.hpp"
#include "drover/tools/tool_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace drover::scheduler {

struct SchedulerOptions {
  std::filesystem::path workspace;
  std::string agent_id = "main";
  TruncationOptions truncation;
  /// Calls of one batch allowed to run at once. Interactive sessions use 1.
  std::uint32_t max_parallel = 1;
  /// Invoked with true when a call starts waiting on a confirmation, false when it resumes.
  std::function<void(bool)> on_awaiting_confirmation;
  /// Live output of streaming tools.
  std::function<void(const std::string &call_id, std::string_view chunk)> on_output;
};

using ToolCallUpdateHandler = std::function<void(const ToolCall &)>;
using BatchCompleteHandler = std::function<void(const std::vector<ToolCall> &)>;

/// Drives tool calls through validation, policy, confirmation and execution.
/// Batches run one after another on a private worker thread; inside a batch calls
/// run in request order, `max_parallel` at a time.
class ToolScheduler {
public:
  ToolScheduler(const tools::ToolRegistry &registry, security::IPolicyDecisionProvider &policy,
                IToolExecutor &executor, bus::MessageBus &bus, SchedulerOptions options = {});
  ~ToolScheduler();

  ToolScheduler(const ToolScheduler &) = delete;
  ToolScheduler &operator=(const ToolScheduler &) = delete;

  /// Enqueues a batch and returns immediately. The future yields the batch's calls,
  /// all terminal, in request order.
  [[nodiscard]] std::future<std::vector<ToolCall>>
  schedule(std::vector<ToolCallRequest> requests, common::CancellationToken cancel = {});

  /// Resumes a call suspended in awaiting_approval.
  [[nodiscard]] common::Status handle_confirmation_response(const bus::ConfirmationResponse &response);

  /// Cancels every call not yet terminal, including the one executing.
  void cancel_all(const std::string &reason);

  void on_update(ToolCallUpdateHandler handler);
  void on_batch_complete(BatchCompleteHandler handler);

  /// Calls of the batch in progress.
  [[nodiscard]] std::vector<ToolCall> active_calls() const;
  [[nodiscard]] bool idle() const;
  /// Highest number of calls observed in `executing` at the same time.
  [[nodiscard]] std::uint32_t max_concurrent_executing() const {
    return max_executing_.load();
  }

private:
  struct Batch {
    std::vector<ToolCall> calls;
    common::CancellationToken cancel;
    std::uint64_t epoch = 0;
    bool user_cancelled = false;
    std::promise<std::vector<ToolCall>> done;
  };

  void worker_loop();
  void run_batch(Batch &batch);
  void process_call(Batch &batch, std::size_t index);

  /// Reason the call must be cancelled now, if any.
  [[nodiscard]] std::optional<std::string> cancel_reason_locked(const Batch &batch) const;
  [[nodiscard]] std::optional<std::string> cancel_reason(const Batch &batch) const;

  void transition(Batch &batch, std::size_t index, ToolCallState next);
  void finish(Batch &batch, std::size_t index, ToolCallState terminal, std::string error);
  void notify_update(const ToolCall &call);

  /// Publishes a confirmation request and waits for its answer or for cancellation.
  [[nodiscard]] std::optional<bus::ConfirmationResponse> await_confirmation(Batch &batch,
                                                                            std::size_t index);
  bool accept_response(const bus::ConfirmationResponse &response);

  [[nodiscard]] common::Status validate(const ToolCall &call, const tools::ITool *tool) const;
  void execute(Batch &batch, std::size_t index);

  const tools::ToolRegistry &registry_;
  security::IPolicyDecisionProvider &policy_;
  IToolExecutor &executor_;
  bus::MessageBus &bus_;
  SchedulerOptions options_;
  std::size_t bus_subscription_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::unique_ptr<Batch>> queue_;
  Batch *active_ = nullptr;
  bool stopping_ = false;
  std::uint64_t epoch_ = 0;
  std::string epoch_reason_;
  std::map<std::string, std::optional<bus::ConfirmationResponse>> awaiting_;
  std::vector<std::shared_ptr<common::CancellationSource>> in_flight_;

  std::mutex handlers_mutex_;
  std::vector<ToolCallUpdateHandler> update_handlers_;
  std::vector<BatchCompleteHandler> batch_handlers_;

  std::atomic<std::uint32_t> executing_{0};
  std::atomic<std::uint32_t> max_executing_{0};

  std::thread worker_;
};

} // namespace drover::scheduler
