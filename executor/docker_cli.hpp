#ifndef EXECUTOR_DOCKER_CLI_HPP
#define EXECUTOR_DOCKER_CLI_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "executor/container_runtime.hpp"
#include "sandbox/process.hpp"

namespace executor {

// ContainerRuntime that drives the docker command line client.
class DockerCli : public ContainerRuntime {
 public:
  // host is passed to --host; the client default is used when it is empty.
  DockerCli(std::string binary, std::string host);

  bool HasImage(const std::string& image,
                const util::CancellationScope& scope) override;
  void PullImage(const std::string& image,
                 const util::CancellationScope& scope) override;
  std::string Create(const ContainerSpec& spec,
                     const util::CancellationScope& scope) override;
  void Start(const std::string& id,
             const util::CancellationScope& scope) override;
  void AttachStdin(const std::string& id, const std::string& data,
                   const util::CancellationScope& scope) override;
  void FinishStdin(const std::string& id, int32_t exit_code,
                   const util::CancellationScope& scope) override;
  bool Wait(const std::string& id, const util::CancellationScope& scope,
            int32_t* exit_code) override;
  void Logs(const std::string& id, int64_t max_bytes,
            const util::CancellationScope& scope,
            ContainerOutput* output) override;
  void Kill(const std::string& id) override;
  void Remove(const std::string& id) override;

  // Arguments of the create subcommand for spec.
  static std::vector<std::string> CreateArgs(const ContainerSpec& spec);

  ~DockerCli() override;

 private:
  // Runs the client with args. Throws infrastructure_error if it cannot be
  // started.
  sandbox::ProcessResult Run(const std::vector<std::string>& args,
                             const util::CancellationScope& scope,
                             int64_t max_output_bytes, const std::string& what);
  // Throws infrastructure_error if the command did not succeed.
  void Check(const sandbox::ProcessResult& result, const std::string& what);
  std::vector<std::string> BaseArgs() const;
  // Detaches the stdin client of id, if any.
  std::unique_ptr<sandbox::Process> TakeAttached(const std::string& id);

  std::string binary_;
  std::string host_;
  absl::Mutex mutex_;
  // Clients streaming stdin into running containers, by container id.
  std::map<std::string, std::unique_ptr<sandbox::Process>> attached_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace executor

#endif
