#include "executor/sandbox_executor.hpp"

#include "absl/strings/ascii.h"
#include "executor/container_backend.hpp"
#include "executor/errors.hpp"
#include "executor/proxy_backend.hpp"
#include "glog/logging.h"
#include "manager/config.hpp"
#include "manager/language.hpp"
#include "util/id.hpp"

namespace executor {

namespace {
const size_t kMaxIdLength = 128;
}  // namespace

bool ValidExecutionId(const std::string& id) {
  if (id.empty() || id.size() > kMaxIdLength || id == "." || id == "..") {
    return false;
  }
  for (char c : id) {
    if (!absl::ascii_isalnum(c) && c != '-' && c != '_' && c != '.') {
      return false;
    }
  }
  return true;
}

SandboxExecutor::SandboxExecutor(const manager::Manager* manager,
                                 std::unique_ptr<ContainerRuntime> runtime)
    : manager_(manager) {
  backends_.emplace_back(
      new ContainerBackend(manager_, std::move(runtime), &tracker_));
  backends_.emplace_back(new ProxyBackend(manager_, &tracker_));
}

SandboxExecutor::~SandboxExecutor() { Close(); }

Run SandboxExecutor::Resolve(const proto::ExecuteRequest& request) const {
  if (absl::StripAsciiWhitespace(request.language()).empty()) {
    throw invalid_request("language is required");
  }
  absl::optional<proto::LanguageTemplate> tmpl =
      manager_->GetTemplate(request.language());
  if (!tmpl) throw unsupported_language(request.language());

  Run run;
  run.request = request;
  if (run.request.id().empty()) {
    run.request.set_id(util::RandomId());
  } else if (!ValidExecutionId(run.request.id())) {
    throw invalid_request("invalid execution id: " + run.request.id());
  }
  run.tmpl = *tmpl;
  run.quota = manager_->EffectiveQuota(tmpl->language());
  run.isolation = request.isolation() != proto::ISOLATION_UNSPECIFIED
                      ? request.isolation()
                      : manager_->Config().isolation;
  if (run.isolation == proto::ISOLATION_UNSPECIFIED) {
    run.isolation = proto::CONTAINER;
  }
  if (run.isolation == proto::FIRECRACKER &&
      absl::StripAsciiWhitespace(manager_->Config().firecracker_proxy_cmd)
          .empty()) {
    throw config_error(
        "firecracker isolation requested but no proxy command is configured");
  }
  run.timeout = EffectiveTimeout(request, run.quota);
  return run;
}

Backend* SandboxExecutor::BackendFor(proto::IsolationMode mode) const {
  for (const auto& backend : backends_) {
    if (backend->Supports(mode)) return backend.get();
  }
  throw config_error("no backend for isolation mode " +
                     manager::IsolationModeName(mode));
}

proto::ExecuteResult SandboxExecutor::Execute(
    const proto::ExecuteRequest& request,
    const util::CancellationScope& scope) {
  Run run = Resolve(request);
  Backend* backend = BackendFor(run.isolation);
  LOG(INFO) << "Executing " << run.request.id() << " ("
            << run.tmpl.language() << ", "
            << manager::IsolationModeName(run.isolation) << ", timeout "
            << run.timeout.count() << "ms)";
  try {
    proto::ExecuteResult result = backend->Execute(run, scope);
    metrics_.RecordResult(result.status());
    return result;
  } catch (const infrastructure_error& e) {
    LOG(ERROR) << "Execution " << run.request.id() << " failed: " << e.what();
    metrics_.RecordError();
    throw;
  }
}

void SandboxExecutor::Kill(const std::string& id) { tracker_.Kill(id); }

proto::ExecutorStats SandboxExecutor::Stats() const {
  proto::ExecutorStats stats;
  metrics_.Snapshot(&stats);
  stats.set_active(tracker_.ActiveCount());
  stats.set_backend(kBackendName);
  for (const char* feature :
       {"docker-cli", "gvisor-runtime", "firecracker-proxy",
        "per-language-quotas", "package-cache-mounts"}) {
    stats.add_features(feature);
  }
  return stats;
}

void SandboxExecutor::Close() {
  size_t active = tracker_.ActiveCount();
  if (active > 0) LOG(WARNING) << "Killing " << active << " executions";
  tracker_.KillAll();
}

}  // namespace executor
