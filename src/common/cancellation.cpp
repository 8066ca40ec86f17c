#include "drover/common/cancellation.hpp"

#include <thread>
#include <vector>

namespace drover::common {

bool CancellationToken::cancelled() const {
  if (!state_) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

std::string CancellationToken::reason() const {
  if (!state_) {
    return "";
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->reason;
}

std::size_t CancellationToken::on_cancel(std::function<void()> callback) const {
  if (!state_) {
    return 0;
  }
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled) {
      const std::size_t id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(callback));
      return id;
    }
  }
  callback();
  return 0;
}

void CancellationToken::remove_callback(const std::size_t id) const {
  if (!state_ || id == 0) {
    return;
  }
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->callbacks.erase(id);
  if (state_->running_id == id && state_->running_thread != std::this_thread::get_id()) {
    state_->callback_done.wait(lock, [this, id] { return state_->running_id != id; });
  }
}

bool CancellationToken::wait_for(const std::chrono::milliseconds timeout) const {
  if (!state_) {
    std::this_thread::sleep_for(timeout);
    return false;
  }
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken &parent)
    : state_(std::make_shared<detail::CancellationState>()), parent_(parent) {
  std::weak_ptr<detail::CancellationState> weak = state_;
  parent_registration_ = parent_.on_cancel([weak, parent = parent_] {
    if (auto state = weak.lock()) {
      CancellationSource::cancel_state(state, parent.reason());
    }
  });
}

CancellationSource::~CancellationSource() { parent_.remove_callback(parent_registration_); }

void CancellationSource::cancel(const std::string &reason) { cancel_state(state_, reason); }

void CancellationSource::cancel_state(const std::shared_ptr<detail::CancellationState> &state,
                                      const std::string &reason) {
  std::vector<std::size_t> ids;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->cancelled) {
      return;
    }
    state->cancelled = true;
    state->reason = reason;
    for (const auto &entry : state->callbacks) {
      ids.push_back(entry.first);
    }
  }
  state->cv.notify_all();

  // Callbacks run one at a time so remove_callback() can wait for the one in progress.
  struct RunningGuard {
    detail::CancellationState &state;
    ~RunningGuard() {
      {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.running_id = 0;
      }
      state.callback_done.notify_all();
    }
  };
  for (const auto id : ids) {
    std::function<void()> callback;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      const auto it = state->callbacks.find(id);
      if (it == state->callbacks.end()) {
        continue;
      }
      callback = std::move(it->second);
      state->callbacks.erase(it);
      state->running_id = id;
      state->running_thread = std::this_thread::get_id();
    }
    RunningGuard guard{*state};
    callback();
  }
}

bool CancellationSource::cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

CancellationToken CancellationSource::token() const { return CancellationToken(state_); }

ScopedCancelCallback::ScopedCancelCallback(CancellationToken token, std::function<void()> callback)
    : token_(std::move(token)) {
  id_ = token_.on_cancel(std::move(callback));
}

ScopedCancelCallback::~ScopedCancelCallback() { token_.remove_callback(id_); }

} // namespace drover::common
