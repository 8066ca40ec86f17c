#include "drover/scheduler/tool_scheduler.hpp"

#include "drover/common/hash.hpp"
#include "drover/observability/global.hpp"
#include "drover/tools/schema_validator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>

namespace drover::scheduler {

namespace {

std::string confirmation_details(const ToolCallRequest &request) {
  if (auto command = tools::arg_string(request.args, "command"); command.has_value()) {
    return request.name + ": " + *command;
  }
  if (auto path = tools::arg_string(request.args, "path"); path.has_value()) {
    return request.name + ": " + *path;
  }
  return request.name + " " + tools::serialize_tool_args(request.args);
}

} // namespace

ToolScheduler::ToolScheduler(const tools::ToolRegistry &registry,
                             security::IPolicyDecisionProvider &policy, IToolExecutor &executor,
                             bus::MessageBus &bus, SchedulerOptions options)
    : registry_(registry), policy_(policy), executor_(executor), bus_(bus),
      options_(std::move(options)) {
  bus_subscription_ = bus_.subscribe_responses(
      [this](const bus::ConfirmationResponse &response) { accept_response(response); });
  worker_ = std::thread([this] { worker_loop(); });
}

ToolScheduler::~ToolScheduler() {
  bus_.unsubscribe(bus_subscription_);
  cancel_all("Scheduler shut down");
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::future<std::vector<ToolCall>> ToolScheduler::schedule(std::vector<ToolCallRequest> requests,
                                                           common::CancellationToken cancel) {
  auto batch = std::make_unique<Batch>();
  batch->calls.reserve(requests.size());
  for (auto &request : requests) {
    batch->calls.emplace_back(std::move(request));
  }
  batch->cancel = std::move(cancel);
  auto future = batch->done.get_future();

  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->epoch = epoch_;
    queue_.push_back(std::move(batch));
    depth = queue_.size();
  }
  cv_.notify_all();
  observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  return future;
}

common::Status ToolScheduler::handle_confirmation_response(const bus::ConfirmationResponse &response) {
  if (!accept_response(response)) {
    return common::Status::error("no tool call awaiting confirmation " + response.correlation_id);
  }
  bus_.withdraw(response.correlation_id);
  return common::Status::success();
}

bool ToolScheduler::accept_response(const bus::ConfirmationResponse &response) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = awaiting_.find(response.correlation_id);
    if (it == awaiting_.end() || it->second.has_value()) {
      return false;
    }
    it->second = response;
  }
  cv_.notify_all();
  return true;
}

void ToolScheduler::cancel_all(const std::string &reason) {
  std::vector<std::shared_ptr<common::CancellationSource>> sources;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++epoch_;
    epoch_reason_ = reason;
    sources = in_flight_;
  }
  cv_.notify_all();
  for (const auto &source : sources) {
    source->cancel(reason);
  }
}

void ToolScheduler::on_update(ToolCallUpdateHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  update_handlers_.push_back(std::move(handler));
}

void ToolScheduler::on_batch_complete(BatchCompleteHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  batch_handlers_.push_back(std::move(handler));
}

std::vector<ToolCall> ToolScheduler::active_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_ == nullptr) {
    return {};
  }
  return active_->calls;
}

bool ToolScheduler::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty() && active_ == nullptr;
}

void ToolScheduler::worker_loop() {
  while (true) {
    std::unique_ptr<Batch> batch;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      batch = std::move(queue_.front());
      queue_.pop_front();
      active_ = batch.get();
    }

    try {
      run_batch(*batch);
    } catch (const std::exception &ex) {
      observability::record_error("scheduler", std::string("tool batch failed: ") + ex.what());
      {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = nullptr;
      }
      batch->done.set_exception(std::current_exception());
    }
  }
}

void ToolScheduler::run_batch(Batch &batch) {
  const std::size_t count = batch.calls.size();
  const std::size_t parallel = std::max<std::uint32_t>(1, options_.max_parallel);

  if (parallel == 1) {
    for (std::size_t i = 0; i < count; ++i) {
      process_call(batch, i);
    }
  } else {
    // Each worker takes the next unstarted call, so a slow call never holds back the rest.
    std::atomic<std::size_t> next{0};
    const std::size_t workers = std::min(parallel, count);
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      futures.push_back(std::async(std::launch::async, [this, &batch, &next, count] {
        for (std::size_t i = next++; i < count; i = next++) {
          process_call(batch, i);
        }
      }));
    }
    for (auto &future : futures) {
      future.get();
    }
  }

  std::vector<ToolCall> calls;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    calls = batch.calls;
    active_ = nullptr;
  }

  std::vector<BatchCompleteHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers = batch_handlers_;
  }
  for (const auto &handler : handlers) {
    handler(calls);
  }
  batch.done.set_value(std::move(calls));
}

std::optional<std::string> ToolScheduler::cancel_reason_locked(const Batch &batch) const {
  if (batch.epoch < epoch_) {
    return epoch_reason_;
  }
  if (batch.cancel.cancelled()) {
    const std::string reason = batch.cancel.reason();
    return reason.empty() ? std::string("Run cancelled.") : reason;
  }
  if (batch.user_cancelled) {
    return std::string("User cancelled operation");
  }
  return std::nullopt;
}

std::optional<std::string> ToolScheduler::cancel_reason(const Batch &batch) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancel_reason_locked(batch);
}

void ToolScheduler::notify_update(const ToolCall &call) {
  std::vector<ToolCallUpdateHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers = update_handlers_;
  }
  for (const auto &handler : handlers) {
    handler(call);
  }
}

void ToolScheduler::transition(Batch &batch, const std::size_t index, const ToolCallState next) {
  std::optional<ToolCall> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.calls[index].transition(next);
    snapshot = batch.calls[index];
  }
  notify_update(*snapshot);
}

void ToolScheduler::finish(Batch &batch, const std::size_t index, const ToolCallState terminal,
                           std::string error) {
  std::optional<ToolCall> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &call = batch.calls[index];
    if (!error.empty()) {
      call.set_error(std::move(error));
    }
    call.transition(terminal);
    snapshot = call;
  }
  notify_update(*snapshot);
  observability::record_tool_call(snapshot->request().name, snapshot->request().call_id,
                                  std::string(tool_call_state_name(terminal)),
                                  snapshot->duration(), terminal == ToolCallState::Success);
}

common::Status ToolScheduler::validate(const ToolCall &call, const tools::ITool *tool) const {
  const auto &request = call.request();
  if (!request.args_error.empty()) {
    return common::Status::error("Invalid parameters for " + request.name + ": " +
                                 request.args_error);
  }
  const auto valid = tools::validate_args(request.args, tool->parameters_schema());
  if (!valid.ok()) {
    return common::Status::error("Invalid parameters for " + request.name + ": " + valid.error());
  }
  return common::Status::success();
}

void ToolScheduler::process_call(Batch &batch, const std::size_t index) {
  if (auto reason = cancel_reason(batch); reason.has_value()) {
    finish(batch, index, ToolCallState::Cancelled, *reason);
    return;
  }

  const std::string name = batch.calls[index].request().name;
  auto tool = registry_.lookup_shared(name);
  if (tool == nullptr) {
    std::string message = "Tool \"" + name + "\" not found in registry.";
    if (auto suggestion = registry_.suggest(name); suggestion.has_value()) {
      message += " Did you mean \"" + *suggestion + "\"?";
    }
    finish(batch, index, ToolCallState::Error, message);
    return;
  }

  if (auto valid = validate(batch.calls[index], tool.get()); !valid.ok()) {
    finish(batch, index, ToolCallState::Error, valid.error());
    return;
  }

  const auto decision = policy_.decide(name, batch.calls[index].request().args);
  if (decision == security::PolicyDecision::Deny) {
    finish(batch, index, ToolCallState::Cancelled, "Tool execution denied by policy.");
    return;
  }

  if (decision == security::PolicyDecision::AskUser) {
    auto response = await_confirmation(batch, index);
    if (!response.has_value()) {
      finish(batch, index, ToolCallState::Cancelled,
             cancel_reason(batch).value_or("Tool call cancelled."));
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      batch.calls[index].set_outcome(response->outcome);
    }
    switch (response->outcome) {
    case bus::ConfirmationOutcome::Cancel: {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.user_cancelled = true;
      }
      finish(batch, index, ToolCallState::Cancelled, "User cancelled operation");
      return;
    }
    case bus::ConfirmationOutcome::ProceedAlways:
      policy_.allow_always(name);
      break;
    case bus::ConfirmationOutcome::ModifyWithEditor:
      if (response->edited_args.has_value()) {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          batch.calls[index].set_args(*response->edited_args);
        }
        if (auto valid = validate(batch.calls[index], tool.get()); !valid.ok()) {
          finish(batch, index, ToolCallState::Error, valid.error());
          return;
        }
      }
      break;
    case bus::ConfirmationOutcome::ProceedOnce:
      break;
    }
  }

  transition(batch, index, ToolCallState::Scheduled);
  execute(batch, index);
}

std::optional<bus::ConfirmationResponse> ToolScheduler::await_confirmation(Batch &batch,
                                                                           const std::size_t index) {
  const std::string correlation_id = common::random_id("confirm-");
  bus::ConfirmationRequest request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &call = batch.calls[index];
    call.set_correlation_id(correlation_id);
    awaiting_.emplace(correlation_id, std::nullopt);
    request = bus::ConfirmationRequest{.correlation_id = correlation_id,
                                       .call_id = call.request().call_id,
                                       .tool_name = call.request().name,
                                       .args = call.request().args,
                                       .details = confirmation_details(call.request())};
  }
  transition(batch, index, ToolCallState::AwaitingApproval);

  if (options_.on_awaiting_confirmation) {
    options_.on_awaiting_confirmation(true);
  }
  common::ScopedCancelCallback wake(batch.cancel, [this] {
    { std::lock_guard<std::mutex> lock(mutex_); }
    cv_.notify_all();
  });

  bus_.publish(request);

  std::optional<bus::ConfirmationResponse> response;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] {
      const auto it = awaiting_.find(correlation_id);
      return (it != awaiting_.end() && it->second.has_value()) ||
             cancel_reason_locked(batch).has_value() || stopping_;
    });
    if (const auto it = awaiting_.find(correlation_id); it != awaiting_.end()) {
      if (!cancel_reason_locked(batch).has_value() && !stopping_) {
        response = it->second;
      }
      awaiting_.erase(it);
    }
  }
  if (!response.has_value()) {
    bus_.withdraw(correlation_id);
  }

  if (options_.on_awaiting_confirmation) {
    options_.on_awaiting_confirmation(false);
  }
  return response;
}

void ToolScheduler::execute(Batch &batch, const std::size_t index) {
  auto source = std::make_shared<common::CancellationSource>(batch.cancel);
  std::optional<std::string> early;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    early = cancel_reason_locked(batch);
    if (!early.has_value()) {
      in_flight_.push_back(source);
    }
  }
  if (early.has_value()) {
    finish(batch, index, ToolCallState::Cancelled, *early);
    return;
  }

  transition(batch, index, ToolCallState::Executing);
  const std::uint32_t now_executing = ++executing_;
  std::uint32_t seen = max_executing_.load();
  while (now_executing > seen && !max_executing_.compare_exchange_weak(seen, now_executing)) {
  }

  const ToolCallRequest request = batch.calls[index].request();
  tools::ToolContext ctx{.workspace_path = options_.workspace,
                         .agent_id = options_.agent_id,
                         .call_id = request.call_id,
                         .cancel = source->token(),
                         .on_output = {}};
  if (options_.on_output) {
    ctx.on_output = [this, call_id = request.call_id](std::string_view chunk) {
      options_.on_output(call_id, chunk);
    };
  }

  auto result = executor_.execute(request.name, request.args, ctx);
  --executing_;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(std::remove(in_flight_.begin(), in_flight_.end(), source), in_flight_.end());
  }

  if (source->cancelled()) {
    const std::string reason = source->token().reason();
    finish(batch, index, ToolCallState::Cancelled,
           "Tool call cancelled: " + (reason.empty() ? std::string("cancelled") : reason));
    return;
  }
  if (!result.ok()) {
    finish(batch, index, ToolCallState::Error, result.error());
    return;
  }

  tools::ToolResult tool_result = std::move(result.value());
  if (!tool_result.success) {
    std::string message = tool_result.output.empty() ? "Tool reported failure." : tool_result.output;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      batch.calls[index].set_result(tool_result);
    }
    finish(batch, index, ToolCallState::Error, std::move(message));
    return;
  }

  const auto truncated =
      truncate_tool_output(request.call_id, tool_result.output, options_.truncation);
  if (truncated.truncated) {
    tool_result.output = truncated.text;
    tool_result.truncated = true;
    tool_result.metadata["omitted_bytes"] = std::to_string(truncated.omitted_bytes);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &call = batch.calls[index];
    call.set_result(std::move(tool_result));
    if (truncated.output_file.has_value()) {
      call.set_output_file(*truncated.output_file);
    }
  }
  finish(batch, index, ToolCallState::Success, "");
}

} // namespace drover::scheduler
