#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace drover::common {

namespace detail {

struct CancellationState {
  std::mutex mutex;
  std::condition_variable cv;
  bool cancelled = false;
  std::string reason;
  std::size_t next_id = 1;
  std::map<std::size_t, std::function<void()>> callbacks;
  // Callback currently being invoked by cancel(); 0 when none.
  std::size_t running_id = 0;
  std::thread::id running_thread;
  std::condition_variable callback_done;
};

} // namespace detail

/// Read side of a cancellation signal. A default-constructed token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] std::string reason() const;

  /// Registers `callback`; runs it immediately when the token is already cancelled.
  /// Returns 0 in that case, otherwise an id for remove_callback().
  std::size_t on_cancel(std::function<void()> callback) const;
  /// Unregisters `id`. When the callback is running on another thread, blocks until it
  /// returns, so its captures may be destroyed afterwards.
  void remove_callback(std::size_t id) const;

  /// Sleeps up to `timeout`. Returns true when cancellation cut the wait short.
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
  CancellationSource();
  /// A child source that is cancelled whenever `parent` is.
  explicit CancellationSource(const CancellationToken &parent);
  ~CancellationSource();

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;

  void cancel(const std::string &reason = "cancelled");
  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] CancellationToken token() const;

private:
  static void cancel_state(const std::shared_ptr<detail::CancellationState> &state,
                           const std::string &reason);

  std::shared_ptr<detail::CancellationState> state_;
  CancellationToken parent_;
  std::size_t parent_registration_ = 0;
};

/// Unregisters a cancellation callback when it goes out of scope.
class ScopedCancelCallback {
public:
  ScopedCancelCallback(CancellationToken token, std::function<void()> callback);
  ~ScopedCancelCallback();

  ScopedCancelCallback(const ScopedCancelCallback &) = delete;
  ScopedCancelCallback &operator=(const ScopedCancelCallback &) = delete;

private:
  CancellationToken token_;
  std::size_t id_ = 0;
};

} // namespace drover::common
