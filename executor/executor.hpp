#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <string>

#include "proto/sandbox.pb.h"
#include "util/cancellation.hpp"

namespace executor {

class Executor {
 public:
  // Runs a request to a terminal state, or until scope ends. Timeouts and
  // kills are reported in the result; failures to run the request throw
  // config_error, invalid_request or infrastructure_error.
  virtual proto::ExecuteResult Execute(const proto::ExecuteRequest& request,
                                       const util::CancellationScope& scope) = 0;

  // Force-terminates a running execution. Throws execution_not_found if no
  // execution with that id is running.
  virtual void Kill(const std::string& id) = 0;

  virtual size_t ActiveCount() const = 0;
  virtual proto::ExecutorStats Stats() const = 0;

  // Kills every running execution.
  virtual void Close() = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
