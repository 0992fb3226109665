#include "manager/config.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "manager/language.hpp"
#include "util/flags.hpp"

namespace manager {

bool ParseIsolationMode(const std::string& name, proto::IsolationMode* mode) {
  std::string lower = absl::AsciiStrToLower(absl::StripAsciiWhitespace(name));
  if (lower == "docker" || lower == "container") {
    *mode = proto::CONTAINER;
  } else if (lower == "gvisor" || lower == "runsc") {
    *mode = proto::GVISOR;
  } else if (lower == "firecracker" || lower == "microvm") {
    *mode = proto::FIRECRACKER;
  } else {
    return false;
  }
  return true;
}

std::string IsolationModeName(proto::IsolationMode mode) {
  switch (mode) {
    case proto::CONTAINER:
      return "docker";
    case proto::GVISOR:
      return "gvisor";
    case proto::FIRECRACKER:
      return "firecracker";
    default:
      return "unspecified";
  }
}

ManagerConfig DefaultConfig() {
  ManagerConfig config;
  config.docker_host = FLAGS_docker_host;
  config.docker_binary = FLAGS_docker_binary;
  if (!ParseIsolationMode(FLAGS_isolation, &config.isolation)) {
    LOG(WARNING) << "Unknown isolation mode " << FLAGS_isolation
                 << ", using docker";
    config.isolation = proto::CONTAINER;
  }
  config.gvisor_runtime = FLAGS_gvisor_runtime;
  config.firecracker_proxy_cmd = FLAGS_firecracker_proxy_cmd;
  config.proxy_grace_ms = FLAGS_proxy_grace_ms;

  config.workspace_root = FLAGS_workspace_root;
  config.package_cache_root = FLAGS_package_cache_root;
  config.enable_package_cache = FLAGS_enable_package_cache;
  config.keep_workspaces = FLAGS_keep_workspaces;

  config.network_enabled = FLAGS_network_enabled;
  config.read_only_rootfs = FLAGS_read_only_rootfs;
  config.no_new_privileges = FLAGS_no_new_privileges;
  config.pull_images = FLAGS_pull_images;
  config.tmpfs_size = FLAGS_tmpfs_size;
  config.shm_size_bytes = FLAGS_shm_size_bytes;
  for (absl::string_view runtime :
       absl::StrSplit(FLAGS_allowed_runtimes, ',', absl::SkipWhitespace())) {
    config.allowed_runtimes.emplace_back(absl::StripAsciiWhitespace(runtime));
  }

  config.default_quota = DefaultQuota();
  config.language_quotas = DefaultLanguageQuotas();
  config.templates = DefaultTemplates();
  return config;
}

}  // namespace manager
