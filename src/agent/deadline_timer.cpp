#include "drover/agent/deadline_timer.hpp"

#include <algorithm>

namespace drover::agent {

DeadlineTimer::DeadlineTimer(const std::chrono::milliseconds budget, std::string reason)
    : budget_(budget), reason_(std::move(reason)), started_(Clock::now()) {
  thread_ = std::thread([this] { run(); });
}

DeadlineTimer::~DeadlineTimer() {
  stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void DeadlineTimer::pause() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pause_depth_++ == 0) {
      paused_at_ = Clock::now();
    }
  }
  cv_.notify_all();
}

void DeadlineTimer::resume() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pause_depth_ == 0) {
      return;
    }
    if (--pause_depth_ == 0 && paused_at_.has_value()) {
      paused_total_ += Clock::now() - *paused_at_;
      paused_at_.reset();
    }
  }
  cv_.notify_all();
}

void DeadlineTimer::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

bool DeadlineTimer::expired() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return expired_;
}

bool DeadlineTimer::paused() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pause_depth_ > 0;
}

std::chrono::milliseconds DeadlineTimer::elapsed_locked(const Clock::time_point now) const {
  auto paused = paused_total_;
  if (paused_at_.has_value()) {
    paused += now - *paused_at_;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - started_ - paused);
}

std::chrono::milliseconds DeadlineTimer::elapsed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return elapsed_locked(Clock::now());
}

std::chrono::milliseconds DeadlineTimer::remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (expired_) {
    return std::chrono::milliseconds(0);
  }
  return std::max(std::chrono::milliseconds(0), budget_ - elapsed_locked(Clock::now()));
}

void DeadlineTimer::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopped_) {
    if (pause_depth_ > 0) {
      cv_.wait(lock, [this] { return stopped_ || pause_depth_ == 0; });
      continue;
    }
    const auto left = budget_ - elapsed_locked(Clock::now());
    if (left <= std::chrono::milliseconds(0)) {
      expired_ = true;
      break;
    }
    cv_.wait_for(lock, left);
  }
  const bool fire = expired_;
  lock.unlock();
  if (fire) {
    source_.cancel(reason_);
  }
}

std::optional<std::chrono::milliseconds>
grace_window(const std::chrono::milliseconds grace_fixed, const std::chrono::milliseconds remaining,
             const std::chrono::milliseconds min_useful) {
  const auto window = std::min(grace_fixed, remaining);
  if (window < min_useful || window <= std::chrono::milliseconds(0)) {
    return std::nullopt;
  }
  return window;
}

} // namespace drover::agent
