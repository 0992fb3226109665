#include "executor/metrics.hpp"

namespace executor {

void Metrics::RecordResult(proto::ExecutionStatus status) {
  total_++;
  switch (status) {
    case proto::COMPLETED:
      success_++;
      break;
    case proto::TIMEOUT:
      timeout_++;
      break;
    case proto::KILLED:
      killed_++;
      break;
    default:
      failed_++;
      break;
  }
}

void Metrics::RecordError() {
  total_++;
  failed_++;
}

void Metrics::Snapshot(proto::ExecutorStats* stats) const {
  stats->set_total(total_);
  stats->set_success(success_);
  stats->set_failed(failed_);
  stats->set_timeout(timeout_);
  stats->set_killed(killed_);
}

}  // namespace executor
