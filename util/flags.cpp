#include "util/flags.hpp"

#include <cstdlib>
#include <string>

namespace {
// Environment variables provide the defaults, so that a deployment can be
// configured without command line arguments.
const char* EnvOr(const char* name, const char* fallback) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : fallback;
}

std::string TempPath(const char* leaf) {
  std::string base = EnvOr("TMPDIR", "/tmp");
  while (base.size() > 1 && base.back() == '/') base.pop_back();
  return base + "/" + leaf;
}
}  // namespace

DEFINE_string(docker_host,
              EnvOr("DOCKER_HOST", "unix:///var/run/docker.sock"),
              "Connection target of the container runtime");
DEFINE_string(docker_binary, EnvOr("CODEBOX_DOCKER_BINARY", "docker"),
              "Container runtime command line client");
DEFINE_bool(pull_images, false, "Pull images that are not present locally");

DEFINE_string(isolation, EnvOr("CODEBOX_ISOLATION", "docker"),
              "Default isolation mode: docker, gvisor or firecracker");
DEFINE_string(gvisor_runtime, EnvOr("CODEBOX_GVISOR_RUNTIME", "runsc"),
              "Container runtime used for the gvisor isolation mode");
DEFINE_string(firecracker_proxy_cmd,
              EnvOr("CODEBOX_FIRECRACKER_PROXY_CMD", ""),
              "Shell command that runs a request inside a microVM");
DEFINE_string(allowed_runtimes, "runc,runsc",
              "Comma separated list of container runtimes that may be used");
DEFINE_int64(proxy_grace_ms, 30000,
             "Time the firecracker proxy gets on top of the execution timeout");

DEFINE_string(workspace_root,
              EnvOr("CODEBOX_WORKSPACE_ROOT",
                    TempPath("codebox-workspaces").c_str()),
              "Where execution workspaces are created");
DEFINE_string(package_cache_root,
              EnvOr("CODEBOX_PACKAGE_CACHE_ROOT",
                    TempPath("codebox-cache").c_str()),
              "Where per-project package caches are kept");
DEFINE_bool(enable_package_cache, true,
            "Mount per-project package caches into the containers");
DEFINE_bool(keep_workspaces, false,
            "Do not delete the workspaces after the execution (debug)");

DEFINE_bool(network_enabled, false, "Give the containers network access");
DEFINE_bool(read_only_rootfs, true,
            "Mount the root filesystem of the containers read-only");
DEFINE_bool(no_new_privileges, true,
            "Forbid privilege escalation inside the containers");
DEFINE_string(tmpfs_size, "64m", "Size of the /tmp tmpfs of the containers");
DEFINE_int64(shm_size_bytes, 64LL * 1024 * 1024,
             "Size of /dev/shm inside the containers");
