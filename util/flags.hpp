#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Container runtime.
DECLARE_string(docker_host);
DECLARE_string(docker_binary);
DECLARE_bool(pull_images);

// Isolation.
DECLARE_string(isolation);
DECLARE_string(gvisor_runtime);
DECLARE_string(firecracker_proxy_cmd);
DECLARE_string(allowed_runtimes);
DECLARE_int64(proxy_grace_ms);

// Host storage.
DECLARE_string(workspace_root);
DECLARE_string(package_cache_root);
DECLARE_bool(enable_package_cache);
DECLARE_bool(keep_workspaces);

// Hardening.
DECLARE_bool(network_enabled);
DECLARE_bool(read_only_rootfs);
DECLARE_bool(no_new_privileges);
DECLARE_string(tmpfs_size);
DECLARE_int64(shm_size_bytes);

#endif
