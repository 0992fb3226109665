#include "executor/tracker.hpp"

#include "executor/errors.hpp"
#include "glog/logging.h"

namespace executor {

void ExecutionTracker::TrackStart(const std::string& id, Entry entry) {
  absl::MutexLock lock(&mutex_);
  if (entries_.count(id)) {
    throw invalid_request("execution " + id + " is already running");
  }
  if (entry.started_at == std::chrono::steady_clock::time_point()) {
    entry.started_at = std::chrono::steady_clock::now();
  }
  VLOG(1) << "Tracking " << id << " (" << entry.handle << ")";
  entries_.emplace(id, std::move(entry));
}

void ExecutionTracker::TrackStop(const std::string& id) {
  absl::MutexLock lock(&mutex_);
  entries_.erase(id);
}

void ExecutionTracker::Kill(const std::string& id) {
  std::function<void()> cancel;
  std::function<void()> terminate;
  {
    absl::MutexLock lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) throw execution_not_found(id);
    cancel = it->second.cancel;
    terminate = it->second.terminate;
  }
  LOG(WARNING) << "Killing execution " << id;
  // Callbacks run without the lock held.
  if (cancel) cancel();
  if (terminate) terminate();
}

void ExecutionTracker::KillAll() {
  for (const std::string& id : ActiveIds()) {
    try {
      Kill(id);
    } catch (const execution_not_found&) {
      // Finished in the meantime.
    }
  }
}

size_t ExecutionTracker::ActiveCount() const {
  absl::MutexLock lock(&mutex_);
  return entries_.size();
}

bool ExecutionTracker::IsTracked(const std::string& id) const {
  absl::MutexLock lock(&mutex_);
  return entries_.count(id) > 0;
}

std::vector<std::string> ExecutionTracker::ActiveIds() const {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> ids;
  for (const auto& kv : entries_) ids.push_back(kv.first);
  return ids;
}

}  // namespace executor
