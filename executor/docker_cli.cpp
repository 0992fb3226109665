#include "executor/docker_cli.hpp"

#include <chrono>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "executor/errors.hpp"
#include "glog/logging.h"

namespace executor {

namespace {
const int64_t kMaxCliOutput = 1024 * 1024;
// The output of the container is collected with Logs; the attach client only
// keeps enough to report its own errors.
const int64_t kMaxAttachOutput = 4096;
// Bound of the commands that must run after the execution scope has ended.
const auto kCleanupTimeout = std::chrono::seconds(30);  // NOLINT
}  // namespace

DockerCli::DockerCli(std::string binary, std::string host)
    : binary_(std::move(binary)), host_(std::move(host)) {}

std::vector<std::string> DockerCli::BaseArgs() const {
  std::vector<std::string> args = {binary_};
  if (!host_.empty()) {
    args.push_back("--host");
    args.push_back(host_);
  }
  return args;
}

sandbox::ProcessResult DockerCli::Run(const std::vector<std::string>& args,
                                      const util::CancellationScope& scope,
                                      int64_t max_output_bytes,
                                      const std::string& what) {
  sandbox::ProcessOptions options;
  options.args = BaseArgs();
  options.args.insert(options.args.end(), args.begin(), args.end());
  options.max_output_bytes = max_output_bytes;
  VLOG(2) << absl::StrJoin(options.args, " ");
  sandbox::ProcessResult result;
  std::string error_msg;
  if (!sandbox::Process::Run(options, scope, &result, &error_msg)) {
    throw infrastructure_error(what + ": " + error_msg);
  }
  return result;
}

void DockerCli::Check(const sandbox::ProcessResult& result,
                      const std::string& what) {
  if (result.killed) {
    throw infrastructure_error(what + ": interrupted");
  }
  if (result.signal != 0) {
    throw infrastructure_error(what + ": killed by signal " +
                               std::to_string(result.signal));
  }
  if (result.status_code != 0) {
    throw infrastructure_error(
        what + " failed: " +
        std::string(absl::StripAsciiWhitespace(result.stderr_data)));
  }
}

bool DockerCli::HasImage(const std::string& image,
                         const util::CancellationScope& scope) {
  sandbox::ProcessResult result =
      Run({"image", "inspect", "--format", "{{.Id}}", image}, scope,
          kMaxCliOutput, "image inspect");
  if (!result.killed && result.signal == 0 && result.status_code != 0 &&
      absl::StrContains(absl::AsciiStrToLower(result.stderr_data),
                        "no such image")) {
    return false;
  }
  Check(result, "image inspect");
  return true;
}

void DockerCli::PullImage(const std::string& image,
                          const util::CancellationScope& scope) {
  LOG(INFO) << "Pulling image " << image;
  Check(Run({"pull", "--quiet", image}, scope, kMaxCliOutput, "pull " + image),
        "pull " + image);
}

std::vector<std::string> DockerCli::CreateArgs(const ContainerSpec& spec) {
  std::vector<std::string> args = {"create"};
  auto flag = [&args](const std::string& name, const std::string& value) {
    args.push_back(name);
    args.push_back(value);
  };
  if (!spec.name.empty()) flag("--name", spec.name);
  if (!spec.work_dir.empty()) flag("--workdir", spec.work_dir);
  if (!spec.runtime.empty()) flag("--runtime", spec.runtime);
  flag("--cap-drop", "ALL");
  flag("--network", spec.network_enabled ? "bridge" : "none");
  if (spec.read_only_rootfs) args.push_back("--read-only");
  if (spec.no_new_privileges) flag("--security-opt", "no-new-privileges:true");
  if (!spec.tmpfs_options.empty()) flag("--tmpfs", "/tmp:" + spec.tmpfs_options);
  if (spec.shm_size_bytes > 0) {
    flag("--shm-size", std::to_string(spec.shm_size_bytes));
  }
  if (spec.memory_bytes > 0) {
    flag("--memory", std::to_string(spec.memory_bytes));
    flag("--memory-swap", std::to_string(spec.memory_bytes));
  }
  if (spec.nano_cpus > 0) {
    flag("--cpus", absl::StrCat(static_cast<double>(spec.nano_cpus) / 1e9));
  }
  if (spec.pids_limit > 0) flag("--pids-limit", std::to_string(spec.pids_limit));
  for (const auto& kv : spec.env) flag("--env", kv.first + "=" + kv.second);
  for (const ContainerSpec::Mount& mount : spec.mounts) {
    flag("--mount", "type=bind,source=" + mount.host_path +
                        ",target=" + mount.container_path);
  }
  if (spec.open_stdin) {
    args.push_back("--interactive");
    flag("--attach", "stdin");
  }
  args.push_back(spec.image);
  args.insert(args.end(), spec.command.begin(), spec.command.end());
  return args;
}

std::string DockerCli::Create(const ContainerSpec& spec,
                              const util::CancellationScope& scope) {
  sandbox::ProcessResult result =
      Run(CreateArgs(spec), scope, kMaxCliOutput, "create");
  Check(result, "create");
  std::string id(absl::StripAsciiWhitespace(result.stdout_data));
  // Progress messages may precede the id.
  size_t newline = id.find_last_of('\n');
  if (newline != std::string::npos) id = id.substr(newline + 1);
  if (id.empty()) throw infrastructure_error("create: no container id");
  return id;
}

void DockerCli::Start(const std::string& id,
                      const util::CancellationScope& scope) {
  Check(Run({"start", id}, scope, kMaxCliOutput, "start"), "start");
}

void DockerCli::AttachStdin(const std::string& id, const std::string& data,
                            const util::CancellationScope& scope) {
  if (scope.Done()) throw infrastructure_error("attach: interrupted");
  sandbox::ProcessOptions options;
  options.args = BaseArgs();
  options.args.insert(options.args.end(), {"attach", "--sig-proxy=false", id});
  options.feed_stdin = true;
  options.stdin_data = data;
  options.max_output_bytes = kMaxAttachOutput;
  std::unique_ptr<sandbox::Process> process(new sandbox::Process());
  std::string error_msg;
  if (!process->Start(options, &error_msg)) {
    throw infrastructure_error("attach: " + error_msg);
  }
  absl::MutexLock lock(&mutex_);
  attached_[id] = std::move(process);
}

void DockerCli::FinishStdin(const std::string& id, int32_t exit_code,
                            const util::CancellationScope& scope) {
  std::unique_ptr<sandbox::Process> process = TakeAttached(id);
  if (!process) return;
  sandbox::ProcessResult result;
  std::string error_msg;
  if (!process->Wait(scope, &result, &error_msg)) {
    throw infrastructure_error("attach: " + error_msg);
  }
  if (result.killed) throw infrastructure_error("attach: did not terminate");
  // The client exits with the status of the container it is attached to.
  if (result.signal != 0 || result.status_code != exit_code) {
    throw infrastructure_error(
        "attach failed: " +
        std::string(absl::StripAsciiWhitespace(result.stderr_data)));
  }
  if (!result.stdin_error.empty()) {
    throw infrastructure_error("attach: " + result.stdin_error);
  }
}

bool DockerCli::Wait(const std::string& id,
                     const util::CancellationScope& scope,
                     int32_t* exit_code) {
  sandbox::ProcessResult result =
      Run({"wait", id}, scope, kMaxCliOutput, "wait");
  if (result.killed) return false;
  Check(result, "wait");
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(result.stdout_data),
                        exit_code)) {
    throw infrastructure_error("wait: unexpected output " +
                               result.stdout_data);
  }
  return true;
}

void DockerCli::Logs(const std::string& id, int64_t max_bytes,
                     const util::CancellationScope& scope,
                     ContainerOutput* output) {
  sandbox::ProcessResult result = Run({"logs", id}, scope, max_bytes, "logs");
  output->stdout_data = std::move(result.stdout_data);
  output->stderr_data = std::move(result.stderr_data);
  if (result.killed) throw infrastructure_error("logs: interrupted");
  if (result.status_code != 0 || result.signal != 0) {
    throw infrastructure_error("logs failed with status " +
                               std::to_string(result.status_code));
  }
}

void DockerCli::Kill(const std::string& id) {
  util::CancellationScope scope(kCleanupTimeout);
  Check(Run({"kill", "--signal", "KILL", id}, scope, kMaxCliOutput, "kill"),
        "kill");
}

std::unique_ptr<sandbox::Process> DockerCli::TakeAttached(
    const std::string& id) {
  std::unique_ptr<sandbox::Process> process;
  absl::MutexLock lock(&mutex_);
  auto it = attached_.find(id);
  if (it != attached_.end()) {
    process = std::move(it->second);
    attached_.erase(it);
  }
  return process;
}

void DockerCli::Remove(const std::string& id) {
  // Destroying the client kills and reaps it.
  TakeAttached(id).reset();
  util::CancellationScope scope(kCleanupTimeout);
  Check(Run({"rm", "--force", id}, scope, kMaxCliOutput, "rm"), "rm");
}

DockerCli::~DockerCli() {
  absl::MutexLock lock(&mutex_);
  attached_.clear();
}

}  // namespace executor
