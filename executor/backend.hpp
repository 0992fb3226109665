#ifndef EXECUTOR_BACKEND_HPP
#define EXECUTOR_BACKEND_HPP

#include <chrono>
#include <cstdint>

#include "proto/sandbox.pb.h"
#include "util/cancellation.hpp"

namespace executor {

// A request resolved against the manager, ready to be run.
struct Run {
  // The request, with its execution id set.
  proto::ExecuteRequest request;
  proto::LanguageTemplate tmpl;
  proto::ResourceQuota quota;
  proto::IsolationMode isolation = proto::ISOLATION_UNSPECIFIED;
  std::chrono::milliseconds timeout{0};
};

// An isolation strategy. Backends are selected by isolation mode.
class Backend {
 public:
  virtual bool Supports(proto::IsolationMode mode) const = 0;

  // Runs to a terminal state and returns the result; timeouts and kills are
  // results. Throws the exceptions of executor/errors.hpp on failure. The
  // run is never left behind, whatever the outcome.
  virtual proto::ExecuteResult Execute(const Run& run,
                                       const util::CancellationScope& scope) = 0;

  Backend() = default;
  virtual ~Backend() = default;
  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;
  Backend(Backend&&) = delete;
  Backend& operator=(Backend&&) = delete;
};

// Timeout of a run: the request override, else the quota, else 30 seconds.
std::chrono::milliseconds EffectiveTimeout(const proto::ExecuteRequest& request,
                                           const proto::ResourceQuota& quota);

// Milliseconds since the epoch.
int64_t WallClockMillis();

// Conventional exit codes of runs that did not exit on their own.
static const constexpr int32_t kTimeoutExitCode = 124;
static const constexpr int32_t kKilledExitCode = 137;

}  // namespace executor

#endif
