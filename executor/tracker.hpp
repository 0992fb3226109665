#ifndef EXECUTOR_TRACKER_HPP
#define EXECUTOR_TRACKER_HPP

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace executor {

// Registry of the executions that are running, keyed by execution id.
// Thread safe.
class ExecutionTracker {
 public:
  struct Entry {
    // Container id or process description, for logging.
    std::string handle;
    // Ends the cancellation scope of the execution.
    std::function<void()> cancel;
    // Force-terminates the run. May be empty, and may be called more than
    // once.
    std::function<void()> terminate;
    std::chrono::steady_clock::time_point started_at;
  };

  // Throws invalid_request if id is already tracked.
  void TrackStart(const std::string& id, Entry entry);
  // Idempotent.
  void TrackStop(const std::string& id);

  // Cancels and terminates the execution. Throws execution_not_found if id is
  // not running.
  void Kill(const std::string& id);
  // Kills every tracked execution.
  void KillAll();

  size_t ActiveCount() const;
  bool IsTracked(const std::string& id) const;
  std::vector<std::string> ActiveIds() const;

 private:
  mutable absl::Mutex mutex_;
  std::map<std::string, Entry> entries_ ABSL_GUARDED_BY(mutex_);
};

// Removes an execution from the tracker when it goes out of scope.
class TrackerGuard {
 public:
  TrackerGuard(ExecutionTracker* tracker, std::string id)
      : tracker_(tracker), id_(std::move(id)) {}
  ~TrackerGuard() { tracker_->TrackStop(id_); }
  TrackerGuard(const TrackerGuard&) = delete;
  TrackerGuard& operator=(const TrackerGuard&) = delete;
  TrackerGuard(TrackerGuard&&) = delete;
  TrackerGuard& operator=(TrackerGuard&&) = delete;

 private:
  ExecutionTracker* tracker_;
  std::string id_;
};

}  // namespace executor

#endif
