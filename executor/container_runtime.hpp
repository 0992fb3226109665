#ifndef EXECUTOR_CONTAINER_RUNTIME_HPP
#define EXECUTOR_CONTAINER_RUNTIME_HPP

#include <map>
#include <string>
#include <vector>

#include "util/cancellation.hpp"

namespace executor {

// Everything needed to create one container.
struct ContainerSpec {
  struct Mount {
    std::string host_path;
    std::string container_path;
  };

  std::string name;
  std::string image;
  std::string work_dir;
  std::vector<std::string> command;
  std::map<std::string, std::string> env;
  std::vector<Mount> mounts;
  // Empty for the default runtime of the daemon.
  std::string runtime;

  bool network_enabled = false;
  bool read_only_rootfs = false;
  bool no_new_privileges = false;
  // Keep the standard input open until a client attaches and closes it.
  bool open_stdin = false;
  // Options of the tmpfs mounted on /tmp, such as "rw,noexec,nosuid,size=64m".
  std::string tmpfs_options;
  int64_t shm_size_bytes = 0;
  int64_t memory_bytes = 0;
  int64_t nano_cpus = 0;
  int64_t pids_limit = 0;
};

struct ContainerOutput {
  std::string stdout_data;
  std::string stderr_data;
};

// Control plane of a container runtime. Failures of the runtime are thrown as
// infrastructure_error. Thread safe.
class ContainerRuntime {
 public:
  virtual bool HasImage(const std::string& image,
                        const util::CancellationScope& scope) = 0;
  virtual void PullImage(const std::string& image,
                         const util::CancellationScope& scope) = 0;

  // Returns the id of the new container.
  virtual std::string Create(const ContainerSpec& spec,
                             const util::CancellationScope& scope) = 0;
  virtual void Start(const std::string& id,
                     const util::CancellationScope& scope) = 0;

  // Streams data to the standard input of a started container that was
  // created with open_stdin, then closes it.
  virtual void AttachStdin(const std::string& id, const std::string& data,
                           const util::CancellationScope& scope) = 0;

  // Waits for the stdin client of a container that exited with exit_code.
  // Throws infrastructure_error if the data was not delivered.
  virtual void FinishStdin(const std::string& id, int32_t exit_code,
                           const util::CancellationScope& scope) = 0;

  // Waits for the container to stop. Returns false if the scope ends first;
  // otherwise sets exit_code.
  virtual bool Wait(const std::string& id, const util::CancellationScope& scope,
                    int32_t* exit_code) = 0;

  // Collects what the container wrote to stdout and stderr, at most max_bytes
  // of each. On failure the output read so far is left in output.
  virtual void Logs(const std::string& id, int64_t max_bytes,
                    const util::CancellationScope& scope,
                    ContainerOutput* output) = 0;

  // Sends SIGKILL to the container.
  virtual void Kill(const std::string& id) = 0;
  // Removes the container, killing it if needed.
  virtual void Remove(const std::string& id) = 0;

  ContainerRuntime() = default;
  virtual ~ContainerRuntime() = default;
  ContainerRuntime(const ContainerRuntime&) = delete;
  ContainerRuntime& operator=(const ContainerRuntime&) = delete;
  ContainerRuntime(ContainerRuntime&&) = delete;
  ContainerRuntime& operator=(ContainerRuntime&&) = delete;
};

}  // namespace executor

#endif
