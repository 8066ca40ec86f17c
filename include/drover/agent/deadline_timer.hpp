#pragma once

#include "drover/common/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace drover::agent {

/// Wall-clock budget that cancels its token when it runs out. Time spent paused
/// does not count against the budget.
class DeadlineTimer {
public:
  DeadlineTimer(std::chrono::milliseconds budget, std::string reason);
  ~DeadlineTimer();

  DeadlineTimer(const DeadlineTimer &) = delete;
  DeadlineTimer &operator=(const DeadlineTimer &) = delete;

  /// Pauses nest; the clock resumes when every pause has been matched.
  void pause();
  void resume();
  /// Stops the timer without firing.
  void stop();

  [[nodiscard]] bool expired() const;
  [[nodiscard]] bool paused() const;
  [[nodiscard]] std::chrono::milliseconds budget() const { return budget_; }
  [[nodiscard]] std::chrono::milliseconds elapsed() const;
  [[nodiscard]] std::chrono::milliseconds remaining() const;
  [[nodiscard]] common::CancellationToken token() const { return source_.token(); }

private:
  using Clock = std::chrono::steady_clock;

  void run();
  [[nodiscard]] std::chrono::milliseconds elapsed_locked(Clock::time_point now) const;

  const std::chrono::milliseconds budget_;
  const std::string reason_;
  const Clock::time_point started_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Clock::duration paused_total_{0};
  std::optional<Clock::time_point> paused_at_;
  int pause_depth_ = 0;
  bool stopped_ = false;
  bool expired_ = false;

  common::CancellationSource source_;
  std::thread thread_;
};

/// Time allowed for the final recovery turn: the fixed grace period, clipped to what
/// is left of the run. std::nullopt when that is below `min_useful`.
[[nodiscard]] std::optional<std::chrono::milliseconds>
grace_window(std::chrono::milliseconds grace_fixed, std::chrono::milliseconds remaining,
             std::chrono::milliseconds min_useful);

} // namespace drover::agent
