#ifndef EXECUTOR_SANDBOX_EXECUTOR_HPP
#define EXECUTOR_SANDBOX_EXECUTOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "executor/backend.hpp"
#include "executor/container_runtime.hpp"
#include "executor/executor.hpp"
#include "executor/metrics.hpp"
#include "executor/tracker.hpp"
#include "manager/manager.hpp"

namespace executor {

// Executor that resolves requests against a Manager and hands them to the
// backend of their isolation mode: containers for docker and gvisor, the
// external proxy for firecracker.
class SandboxExecutor : public Executor {
 public:
  static const constexpr char* kBackendName = "docker-cli";

  // manager must outlive the executor.
  SandboxExecutor(const manager::Manager* manager,
                  std::unique_ptr<ContainerRuntime> runtime);

  proto::ExecuteResult Execute(const proto::ExecuteRequest& request,
                               const util::CancellationScope& scope) override;
  void Kill(const std::string& id) override;
  size_t ActiveCount() const override { return tracker_.ActiveCount(); }
  proto::ExecutorStats Stats() const override;
  void Close() override;

  ~SandboxExecutor() override;

 private:
  // Validates the request and resolves its template, quota, id and
  // isolation mode.
  Run Resolve(const proto::ExecuteRequest& request) const;
  Backend* BackendFor(proto::IsolationMode mode) const;

  const manager::Manager* manager_;
  ExecutionTracker tracker_;
  Metrics metrics_;
  std::vector<std::unique_ptr<Backend>> backends_;
};

// Returns true if id can name an execution and its workspace directory.
bool ValidExecutionId(const std::string& id);

}  // namespace executor

#endif
