#ifndef EXECUTOR_PROXY_BACKEND_HPP
#define EXECUTOR_PROXY_BACKEND_HPP

#include "executor/backend.hpp"
#include "executor/tracker.hpp"
#include "manager/manager.hpp"

namespace executor {

// Delegates runs to the external microVM proxy command, which receives a JSON
// ProxyRequest on its standard input and answers with a JSON ExecuteResult.
// Resource limits are enforced by the proxy.
class ProxyBackend : public Backend {
 public:
  // manager and tracker must outlive the backend.
  ProxyBackend(const manager::Manager* manager, ExecutionTracker* tracker)
      : manager_(manager), tracker_(tracker) {}

  bool Supports(proto::IsolationMode mode) const override {
    return mode == proto::FIRECRACKER;
  }
  proto::ExecuteResult Execute(const Run& run,
                               const util::CancellationScope& scope) override;

 private:
  const manager::Manager* manager_;
  ExecutionTracker* tracker_;
};

}  // namespace executor

#endif
