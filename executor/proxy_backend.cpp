#include "executor/proxy_backend.hpp"

#include <memory>

#include "absl/strings/ascii.h"
#include "executor/errors.hpp"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "sandbox/process.hpp"
#include "util/utf8.hpp"

namespace executor {

namespace {
const int64_t kMaxProxyOutput = 64LL * 1024 * 1024;
}  // namespace

proto::ExecuteResult ProxyBackend::Execute(
    const Run& run, const util::CancellationScope& parent) {
  const manager::ManagerConfig& config = manager_->Config();
  const proto::ExecuteRequest& request = run.request;
  const std::string& id = request.id();
  if (absl::StripAsciiWhitespace(config.firecracker_proxy_cmd).empty()) {
    throw config_error(
        "firecracker isolation requested but no proxy command is configured");
  }

  proto::ProxyRequest payload;
  payload.set_id(id);
  payload.set_project(request.project_id());
  payload.set_language(run.tmpl.language());
  payload.set_code(request.code());
  payload.set_stdin(request.stdin());
  *payload.mutable_env() = request.env();
  *payload.mutable_files() = request.files();
  *payload.mutable_template_() = run.tmpl;
  *payload.mutable_quota() = run.quota;
  std::string json;
  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names = true;
  auto status =
      google::protobuf::util::MessageToJsonString(payload, &json, print_options);
  if (!status.ok()) {
    throw infrastructure_error("encode proxy request: " + status.ToString());
  }

  // The proxy enforces the timeout itself; this is only a safety net.
  auto scope = std::make_shared<util::CancellationScope>(
      parent, run.timeout + std::chrono::milliseconds(config.proxy_grace_ms));
  ExecutionTracker::Entry entry;
  entry.handle = "firecracker proxy";
  entry.cancel = [scope]() { scope->Cancel(); };
  tracker_->TrackStart(id, std::move(entry));
  TrackerGuard tracked(tracker_, id);

  sandbox::ProcessOptions options;
  options.args = {"sh", "-lc", config.firecracker_proxy_cmd};
  options.feed_stdin = true;
  options.stdin_data = json;
  options.max_output_bytes = kMaxProxyOutput;
  int64_t started_at = WallClockMillis();
  LOG(INFO) << id << ": running firecracker proxy";
  sandbox::ProcessResult process;
  std::string error_msg;
  if (!sandbox::Process::Run(options, *scope, &process, &error_msg)) {
    throw infrastructure_error("firecracker proxy: " + error_msg);
  }

  proto::ExecuteResult result;
  if (process.killed) {
    result.set_id(id);
    result.set_image(run.tmpl.image());
    if (scope->state() == util::CancellationScope::State::CANCELLED) {
      result.set_status(proto::KILLED);
      result.set_killed(true);
      result.set_exit_code(kKilledExitCode);
    } else {
      result.set_status(proto::TIMEOUT);
      result.set_timed_out(true);
      result.set_exit_code(kTimeoutExitCode);
    }
    std::string stderr_data = std::move(process.stderr_data);
    if (static_cast<int64_t>(stderr_data.size()) > run.quota.max_output_bytes() &&
        run.quota.max_output_bytes() > 0) {
      stderr_data.resize(run.quota.max_output_bytes());
    }
    result.set_error_output(util::ValidUtf8(std::move(stderr_data)));
    LOG(WARNING) << id << ": firecracker proxy interrupted, "
                 << proto::ExecutionStatus_Name(result.status());
  } else {
    if (process.signal != 0 || process.status_code != 0) {
      std::string reason =
          process.signal != 0
              ? "killed by signal " + std::to_string(process.signal)
              : "exit status " + std::to_string(process.status_code);
      throw infrastructure_error("firecracker proxy failed: " + reason + ": " +
                                 process.stderr_data);
    }
    if (process.stdout_truncated) {
      throw infrastructure_error(
          "firecracker proxy returned invalid JSON: output too large");
    }
    google::protobuf::util::JsonParseOptions parse_options;
    parse_options.ignore_unknown_fields = true;
    parse_options.case_insensitive_enum_parsing = true;
    status = google::protobuf::util::JsonStringToMessage(
        process.stdout_data, &result, parse_options);
    if (!status.ok()) {
      throw infrastructure_error("firecracker proxy returned invalid JSON: " +
                                 status.ToString());
    }
    if (result.id().empty()) result.set_id(id);
    if (result.status() == proto::STATUS_UNSPECIFIED ||
        result.status() == proto::RUNNING) {
      result.set_status(proto::FAILED);
    }
  }

  if (result.started_at_ms() == 0) result.set_started_at_ms(started_at);
  if (result.completed_at_ms() == 0) {
    result.set_completed_at_ms(WallClockMillis());
  }
  result.set_duration_ms(result.completed_at_ms() - result.started_at_ms());
  result.set_isolation(proto::FIRECRACKER);
  LOG(INFO) << id << ": " << proto::ExecutionStatus_Name(result.status())
            << " through the firecracker proxy";
  return result;
}

}  // namespace executor
