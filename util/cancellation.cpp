#include "util/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace util {

namespace {
const auto kSleepSlice = std::chrono::milliseconds(5);  // NOLINT
}  // namespace

CancellationScope::CancellationScope(std::chrono::milliseconds timeout) {
  SetDeadline(Clock::now() + timeout);
}

CancellationScope::CancellationScope(const CancellationScope& parent,
                                     std::chrono::milliseconds timeout)
    : parent_(&parent) {
  SetDeadline(Clock::now() + timeout);
}

void CancellationScope::Cancel() { cancelled_ = true; }

void CancellationScope::SetDeadline(Clock::time_point deadline) {
  absl::MutexLock lock(&mutex_);
  if (!has_deadline_ || deadline < deadline_) {
    deadline_ = deadline;
    has_deadline_ = true;
  }
}

void CancellationScope::SetProbe(std::function<bool()> probe) {
  absl::MutexLock lock(&mutex_);
  probe_ = std::move(probe);
}

CancellationScope::State CancellationScope::state() const {
  if (cancelled_) return State::CANCELLED;
  if (parent_ != nullptr) {
    State parent_state = parent_->state();
    if (parent_state != State::ACTIVE) return parent_state;
  }
  std::function<bool()> probe;
  {
    absl::MutexLock lock(&mutex_);
    if (has_deadline_ && Clock::now() >= deadline_) {
      return State::DEADLINE_EXCEEDED;
    }
    probe = probe_;
  }
  if (probe && probe()) return State::CANCELLED;
  return State::ACTIVE;
}

CancellationScope::Clock::duration CancellationScope::Remaining() const {
  Clock::duration remaining = Clock::duration::max();
  if (parent_ != nullptr) remaining = parent_->Remaining();
  absl::MutexLock lock(&mutex_);
  if (has_deadline_) {
    remaining = std::min(
        remaining, std::max(Clock::duration::zero(), deadline_ - Clock::now()));
  }
  return remaining;
}

bool CancellationScope::SleepFor(Clock::duration duration) const {
  auto until = Clock::now() + duration;
  while (!Done()) {
    auto now = Clock::now();
    if (now >= until) return false;
    std::this_thread::sleep_for(
        std::min<Clock::duration>(kSleepSlice, until - now));
  }
  return true;
}

}  // namespace util
