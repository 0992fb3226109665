#include "executor/backend.hpp"

namespace executor {

namespace {
const std::chrono::milliseconds kFallbackTimeout(30000);
}  // namespace

std::chrono::milliseconds EffectiveTimeout(const proto::ExecuteRequest& request,
                                           const proto::ResourceQuota& quota) {
  if (request.timeout_ms() > 0) {
    return std::chrono::milliseconds(request.timeout_ms());
  }
  if (quota.timeout_ms() > 0) return std::chrono::milliseconds(quota.timeout_ms());
  return kFallbackTimeout;
}

int64_t WallClockMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace executor
