#include "executor/container_backend.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "absl/strings/str_replace.h"
#include "executor/errors.hpp"
#include "glog/logging.h"
#include "manager/config.hpp"
#include "manager/language.hpp"
#include "util/utf8.hpp"

namespace executor {

namespace {

const int64_t kFallbackPidsLimit = 128;
const int64_t kFallbackMemoryBytes = 256LL * 1024 * 1024;
const int64_t kFallbackNanoCpus = 500000000;
// Bounds of the steps that also run after the deadline.
const auto kLogsTimeout = std::chrono::seconds(30);  // NOLINT
const auto kStdinTimeout = std::chrono::seconds(5);  // NOLINT

// Removes the container when it goes out of scope.
class ContainerGuard {
 public:
  ContainerGuard(ContainerRuntime* runtime, std::string id)
      : runtime_(runtime), id_(std::move(id)) {}
  ~ContainerGuard() {
    try {
      runtime_->Remove(id_);
      VLOG(1) << "Removed container " << id_;
    } catch (const std::exception& e) {
      LOG(WARNING) << "Could not remove container " << id_ << ": "
                   << e.what();
    }
  }
  ContainerGuard(const ContainerGuard&) = delete;
  ContainerGuard& operator=(const ContainerGuard&) = delete;
  ContainerGuard(ContainerGuard&&) = delete;
  ContainerGuard& operator=(ContainerGuard&&) = delete;

 private:
  ContainerRuntime* runtime_;
  std::string id_;
};

void AddWarning(proto::ExecuteResult* result, const std::string& warning) {
  LOG(WARNING) << result->id() << ": " << warning;
  result->add_warnings(util::ValidUtf8(warning));
  if (!result->error_output().empty()) result->mutable_error_output()->append("\n");
  result->mutable_error_output()->append(warning);
}

}  // namespace

ContainerBackend::ContainerBackend(const manager::Manager* manager,
                                   std::unique_ptr<ContainerRuntime> runtime,
                                   ExecutionTracker* tracker)
    : manager_(manager), runtime_(std::move(runtime)), tracker_(tracker) {}

bool ContainerBackend::Supports(proto::IsolationMode mode) const {
  return mode == proto::CONTAINER || mode == proto::GVISOR;
}

std::string ContainerBackend::RuntimeFor(proto::IsolationMode mode) const {
  const manager::ManagerConfig& config = manager_->Config();
  std::string runtime;
  switch (mode) {
    case proto::CONTAINER:
      break;
    case proto::GVISOR:
      if (config.gvisor_runtime.empty()) {
        throw config_error(
            "gvisor isolation requested but no gvisor runtime is configured");
      }
      runtime = config.gvisor_runtime;
      break;
    default:
      throw config_error("unsupported container isolation mode: " +
                         manager::IsolationModeName(mode));
  }
  if (!runtime.empty() &&
      std::find(config.allowed_runtimes.begin(), config.allowed_runtimes.end(),
                runtime) == config.allowed_runtimes.end()) {
    throw config_error("runtime \"" + runtime + "\" is not allowed");
  }
  return runtime;
}

ContainerSpec ContainerBackend::BuildSpec(const Run& run,
                                          const StagedFiles& staged,
                                          const std::string& workspace,
                                          const std::string& runtime) const {
  const manager::ManagerConfig& config = manager_->Config();
  const proto::LanguageTemplate& tmpl = run.tmpl;
  if (tmpl.image().empty()) {
    throw config_error("missing image for language template " +
                       tmpl.language());
  }
  if (tmpl.command_template().empty()) {
    throw config_error("language template " + tmpl.language() +
                       " has an empty command");
  }

  ContainerSpec spec;
  // Execution ids are valid container names.
  spec.name = "codebox-" + run.request.id();
  spec.image = tmpl.image();
  spec.work_dir =
      tmpl.work_dir().empty() ? manager::kDefaultWorkDir : tmpl.work_dir();
  for (const std::string& token : tmpl.command_template()) {
    spec.command.push_back(absl::StrReplaceAll(
        token, {{manager::kFilePlaceholder, staged.entry_name}}));
  }
  spec.mounts.push_back({workspace, spec.work_dir});

  // Later sources win.
  for (const auto& kv : tmpl.env()) spec.env[kv.first] = kv.second;
  for (const auto& kv : staged.env) spec.env[kv.first] = kv.second;
  for (const proto::CacheMountSpec& cache : tmpl.cache_mounts()) {
    std::string host_path;
    try {
      host_path =
          manager_->PackageCachePath(run.request.project_id(), cache.name());
    } catch (const std::invalid_argument& e) {
      throw config_error("cache mount of " + tmpl.language() + ": " +
                         e.what());
    } catch (const std::system_error& e) {
      throw infrastructure_error("cache mount " + cache.name() + ": " +
                                 e.what());
    }
    if (host_path.empty()) continue;
    spec.mounts.push_back({host_path, cache.container_path()});
    for (const auto& kv : cache.env()) spec.env[kv.first] = kv.second;
  }
  for (const auto& kv : run.request.env()) spec.env[kv.first] = kv.second;

  spec.runtime = runtime;
  spec.network_enabled = config.network_enabled;
  spec.read_only_rootfs = config.read_only_rootfs;
  spec.no_new_privileges = config.no_new_privileges;
  spec.open_stdin = !run.request.stdin().empty();
  spec.tmpfs_options = "rw,noexec,nosuid";
  if (!config.tmpfs_size.empty()) {
    spec.tmpfs_options += ",size=" + config.tmpfs_size;
  }
  spec.shm_size_bytes = config.shm_size_bytes;

  spec.memory_bytes = run.quota.memory_bytes() > 0 ? run.quota.memory_bytes()
                                                   : kFallbackMemoryBytes;
  spec.nano_cpus = static_cast<int64_t>(run.quota.cpu_cores() * 1e9);
  if (spec.nano_cpus <= 0) spec.nano_cpus = kFallbackNanoCpus;
  spec.pids_limit =
      run.quota.pids_limit() > 0 ? run.quota.pids_limit() : kFallbackPidsLimit;
  return spec;
}

void ContainerBackend::EnsureImage(const std::string& image,
                                   const util::CancellationScope& scope) {
  if (runtime_->HasImage(image, scope)) return;
  if (!manager_->Config().pull_images) {
    throw infrastructure_error("image " + image +
                               " is not available and pulling is disabled");
  }
  runtime_->PullImage(image, scope);
}

proto::ExecuteResult ContainerBackend::Execute(
    const Run& run, const util::CancellationScope& parent) {
  const proto::ExecuteRequest& request = run.request;
  const std::string& id = request.id();
  std::string runtime = RuntimeFor(run.isolation);
  StagedFiles staged = PrepareFiles(run.tmpl, request);

  // Shared with the tracker entry, which may outlive this call briefly.
  auto scope = std::make_shared<util::CancellationScope>(parent, run.timeout);

  Workspace workspace(manager_->WorkspaceRootForProject(request.project_id()),
                      id, manager_->Config().keep_workspaces);
  workspace.Write(staged);
  ContainerSpec spec = BuildSpec(run, staged, workspace.Path(), runtime);
  EnsureImage(spec.image, *scope);

  std::string container_id = runtime_->Create(spec, *scope);
  ContainerGuard container(runtime_.get(), container_id);
  LOG(INFO) << id << ": created container " << container_id << " from "
            << spec.image;

  ExecutionTracker::Entry entry;
  entry.handle = container_id;
  entry.cancel = [scope]() { scope->Cancel(); };
  ContainerRuntime* runtime_ptr = runtime_.get();
  entry.terminate = [runtime_ptr, container_id]() {
    try {
      runtime_ptr->Kill(container_id);
    } catch (const infrastructure_error& e) {
      LOG(WARNING) << "Could not kill container " << container_id << ": "
                   << e.what();
    }
  };
  tracker_->TrackStart(id, std::move(entry));
  TrackerGuard tracked(tracker_, id);

  proto::ExecuteResult result;
  result.set_id(id);
  result.set_status(proto::RUNNING);
  result.set_image(spec.image);
  result.set_isolation(run.isolation);
  result.set_container_id(container_id);
  result.set_started_at_ms(WallClockMillis());
  auto start = std::chrono::steady_clock::now();

  // From here on a kill or the deadline ends the scope, which interrupts the
  // runtime calls; the run is then classified as killed or timed out.
  if (!scope->Done()) {
    try {
      runtime_->Start(container_id, *scope);
    } catch (const infrastructure_error& e) {
      if (!scope->Done()) throw;
      VLOG(1) << id << ": start interrupted: " << e.what();
    }
  }
  bool stdin_attached = false;
  if (spec.open_stdin && !scope->Done()) {
    try {
      runtime_->AttachStdin(container_id, request.stdin(), *scope);
      stdin_attached = true;
    } catch (const infrastructure_error& e) {
      AddWarning(&result, std::string("stdin attach warning: ") + e.what());
    }
  }

  int32_t exit_code = 0;
  bool exited =
      !scope->Done() && runtime_->Wait(container_id, *scope, &exit_code);
  // A container killed through the tracker may exit before the wait notices
  // the cancellation.
  if (exited &&
      scope->state() != util::CancellationScope::State::CANCELLED) {
    result.set_exit_code(exit_code);
    result.set_status(exit_code == 0 ? proto::COMPLETED : proto::FAILED);
    if (stdin_attached) {
      util::CancellationScope stdin_scope(kStdinTimeout);
      try {
        runtime_->FinishStdin(container_id, exit_code, stdin_scope);
      } catch (const infrastructure_error& e) {
        AddWarning(&result, std::string("stdin attach warning: ") + e.what());
      }
    }
  } else {
    if (scope->state() == util::CancellationScope::State::CANCELLED) {
      result.set_status(proto::KILLED);
      result.set_killed(true);
      result.set_exit_code(kKilledExitCode);
    } else {
      result.set_status(proto::TIMEOUT);
      result.set_timed_out(true);
      result.set_exit_code(kTimeoutExitCode);
    }
    LOG(INFO) << id << ": " << proto::ExecutionStatus_Name(result.status())
              << ", killing container " << container_id;
    try {
      runtime_->Kill(container_id);
    } catch (const infrastructure_error& e) {
      LOG(WARNING) << "Could not kill container " << container_id << ": "
                   << e.what();
    }
  }

  util::CancellationScope logs_scope(kLogsTimeout);
  ContainerOutput output;
  try {
    runtime_->Logs(container_id, run.quota.max_output_bytes(), logs_scope,
                   &output);
  } catch (const infrastructure_error& e) {
    AddWarning(&result, std::string("log read warning: ") + e.what());
  }
  result.set_output(util::ValidUtf8(std::move(output.stdout_data)));
  if (!output.stderr_data.empty()) {
    if (!result.error_output().empty()) {
      result.mutable_error_output()->append("\n");
    }
    result.mutable_error_output()->append(output.stderr_data);
  }
  *result.mutable_error_output() = util::ValidUtf8(result.error_output());

  result.set_completed_at_ms(WallClockMillis());
  result.set_duration_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count());
  LOG(INFO) << id << ": " << proto::ExecutionStatus_Name(result.status())
            << " with exit code " << result.exit_code() << " in "
            << result.duration_ms() << "ms";
  return result;
}

}  // namespace executor
