#ifndef EXECUTOR_CONTAINER_BACKEND_HPP
#define EXECUTOR_CONTAINER_BACKEND_HPP

#include <memory>
#include <string>

#include "executor/backend.hpp"
#include "executor/container_runtime.hpp"
#include "executor/tracker.hpp"
#include "executor/workspace.hpp"
#include "manager/manager.hpp"

namespace executor {

// Runs requests in containers, with the default runtime or with the gVisor
// runtime.
class ContainerBackend : public Backend {
 public:
  // manager and tracker must outlive the backend.
  ContainerBackend(const manager::Manager* manager,
                   std::unique_ptr<ContainerRuntime> runtime,
                   ExecutionTracker* tracker);

  bool Supports(proto::IsolationMode mode) const override;
  proto::ExecuteResult Execute(const Run& run,
                               const util::CancellationScope& scope) override;

  // Name of the container runtime of mode, "" for the default one. Throws
  // config_error if the runtime is not configured or not allowed.
  std::string RuntimeFor(proto::IsolationMode mode) const;

  // Configuration of the container of run, with the workspace mounted at the
  // working directory of the template. Throws config_error if the template
  // cannot be run and infrastructure_error if a package cache directory
  // cannot be created.
  ContainerSpec BuildSpec(const Run& run, const StagedFiles& staged,
                          const std::string& workspace,
                          const std::string& runtime) const;

 private:
  void EnsureImage(const std::string& image,
                   const util::CancellationScope& scope);

  const manager::Manager* manager_;
  std::unique_ptr<ContainerRuntime> runtime_;
  ExecutionTracker* tracker_;
};

}  // namespace executor

#endif
