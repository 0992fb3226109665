#ifndef MANAGER_CONFIG_HPP
#define MANAGER_CONFIG_HPP

#include <map>
#include <string>
#include <vector>

#include "proto/sandbox.pb.h"

namespace manager {

// Process-wide configuration of the sandbox.
struct ManagerConfig {
  std::string docker_host;
  std::string docker_binary;
  proto::IsolationMode isolation = proto::ISOLATION_UNSPECIFIED;
  std::string gvisor_runtime;
  std::string firecracker_proxy_cmd;
  int64_t proxy_grace_ms = 0;

  std::string workspace_root;
  std::string package_cache_root;
  bool enable_package_cache = false;
  bool keep_workspaces = false;

  bool network_enabled = false;
  bool read_only_rootfs = false;
  bool no_new_privileges = false;
  bool pull_images = false;
  std::string tmpfs_size;
  int64_t shm_size_bytes = 0;
  // Container runtimes that may be requested. The default runtime, named by
  // the empty string, is always allowed.
  std::vector<std::string> allowed_runtimes;

  proto::ResourceQuota default_quota;
  std::map<std::string, proto::ResourceQuota> language_quotas;
  std::map<std::string, proto::LanguageTemplate> templates;
};

// Parses docker/container, gvisor/runsc and firecracker/microvm, ignoring
// case. Returns false for anything else.
bool ParseIsolationMode(const std::string& name, proto::IsolationMode* mode);

// docker, gvisor or firecracker.
std::string IsolationModeName(proto::IsolationMode mode);

// Configuration built from the command line flags and the built-in templates
// and quotas.
ManagerConfig DefaultConfig();

}  // namespace manager

#endif
