#ifndef UTIL_CANCELLATION_HPP
#define UTIL_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <functional>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace util {

// Bounds a unit of work in time. A scope ends when it is cancelled, when its
// deadline passes, when its external probe reports a cancellation, or when
// its parent ends. Scopes are queried by polling and may be shared between
// threads; the parent must outlive its children.
class CancellationScope {
 public:
  using Clock = std::chrono::steady_clock;

  enum class State { ACTIVE, DEADLINE_EXCEEDED, CANCELLED };

  // A scope that only ends when cancelled.
  CancellationScope() = default;
  explicit CancellationScope(std::chrono::milliseconds timeout);
  // A child scope that also ends after timeout.
  CancellationScope(const CancellationScope& parent,
                    std::chrono::milliseconds timeout);

  void Cancel();

  // Moves the deadline earlier; later deadlines are ignored.
  void SetDeadline(Clock::time_point deadline);

  // Installs a function that is polled to detect cancellations coming from
  // outside, such as a disconnected client.
  void SetProbe(std::function<bool()> probe);

  State state() const;
  bool Done() const { return state() != State::ACTIVE; }

  // Time left before the deadline of this scope or of any ancestor;
  // Clock::duration::max() if there is none.
  Clock::duration Remaining() const;

  // Sleeps for at most duration, returning early when the scope ends.
  // Returns true if the scope has ended.
  bool SleepFor(Clock::duration duration) const;

  CancellationScope(const CancellationScope&) = delete;
  CancellationScope& operator=(const CancellationScope&) = delete;
  CancellationScope(CancellationScope&&) = delete;
  CancellationScope& operator=(CancellationScope&&) = delete;

 private:
  const CancellationScope* parent_ = nullptr;
  std::atomic<bool> cancelled_{false};
  mutable absl::Mutex mutex_;
  bool has_deadline_ ABSL_GUARDED_BY(mutex_) = false;
  Clock::time_point deadline_ ABSL_GUARDED_BY(mutex_);
  std::function<bool()> probe_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace util

#endif
