#ifndef EXECUTOR_METRICS_HPP
#define EXECUTOR_METRICS_HPP

#include <atomic>
#include <cstdint>

#include "proto/sandbox.pb.h"

namespace executor {

// Aggregate counters of an executor. Every executor owns its own sink.
class Metrics {
 public:
  // Counts a run that produced a result.
  void RecordResult(proto::ExecutionStatus status);
  // Counts a run that failed after it was handed to a backend.
  void RecordError();

  // Fills the counters of stats; the active gauge is left untouched.
  void Snapshot(proto::ExecutorStats* stats) const;

  int64_t total() const { return total_; }

 private:
  std::atomic<int64_t> total_{0};
  std::atomic<int64_t> success_{0};
  std::atomic<int64_t> failed_{0};
  std::atomic<int64_t> timeout_{0};
  std::atomic<int64_t> killed_{0};
};

}  // namespace executor

#endif
