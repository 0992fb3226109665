#ifndef EXECUTOR_EXECUTOR_BUILDER_HPP
#define EXECUTOR_EXECUTOR_BUILDER_HPP
#include "executor/executor.hpp"

#include <memory>

#include "manager/manager.hpp"

namespace executor {

class ExecutorBuilder {
 public:
  // Executor driving the docker client configured in the manager. manager
  // must outlive the executor.
  static std::unique_ptr<Executor> Get(const manager::Manager* manager);
};

}  // namespace executor

#endif
