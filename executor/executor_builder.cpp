#include "executor/executor_builder.hpp"

#include "executor/docker_cli.hpp"
#include "executor/sandbox_executor.hpp"
#include "glog/logging.h"
#include "util/which.hpp"

#include <memory>

namespace executor {

std::unique_ptr<Executor> ExecutorBuilder::Get(
    const manager::Manager* manager) {
  const manager::ManagerConfig& config = manager->Config();
  LOG(INFO) << "Using " << config.docker_binary << " on "
            << (config.docker_host.empty() ? "the default host"
                                           : config.docker_host);
  if (util::which(config.docker_binary).empty()) {
    LOG(WARNING) << config.docker_binary
                 << " not found, container isolation will not work";
  }
  std::unique_ptr<ContainerRuntime> runtime(
      new DockerCli(config.docker_binary, config.docker_host));
  return std::unique_ptr<Executor>(
      new SandboxExecutor(manager, std::move(runtime)));
}
}  // namespace executor
