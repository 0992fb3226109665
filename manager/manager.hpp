#ifndef MANAGER_MANAGER_HPP
#define MANAGER_MANAGER_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "manager/config.hpp"
#include "proto/sandbox.pb.h"

namespace manager {

// Read path for the language templates, the resource quotas and the host
// directories used by the executions. Thread safe.
class Manager {
 public:
  // Creates the workspace root and, if caching is enabled, the package cache
  // root. Throws std::invalid_argument if the workspace root is not set and
  // std::system_error if a root cannot be created.
  explicit Manager(ManagerConfig config);

  const ManagerConfig& Config() const { return config_; }

  // Looks up the template of a language, resolving aliases.
  absl::optional<proto::LanguageTemplate> GetTemplate(
      const std::string& language) const;

  // Adds or replaces the template of its language.
  void RegisterTemplate(const proto::LanguageTemplate& tmpl);

  // All templates, ordered by language.
  std::vector<proto::LanguageTemplate> Templates() const;

  // The default quota overlaid with the override of the language. Every field
  // of the result is positive.
  proto::ResourceQuota EffectiveQuota(const std::string& language) const;

  // <workspace root>/<sanitized project>, with "anonymous" for projects whose
  // sanitized id is empty.
  std::string WorkspaceRootForProject(const std::string& project_id) const;

  // <cache root>/<sanitized project or "shared">/<sanitized cache name>,
  // created if missing. Returns "" if package caching is disabled. Throws
  // std::invalid_argument for an empty cache name.
  std::string PackageCachePath(const std::string& project_id,
                               const std::string& cache_name) const;

  Manager(const Manager&) = delete;
  Manager& operator=(const Manager&) = delete;
  Manager(Manager&&) = delete;
  Manager& operator=(Manager&&) = delete;

 private:
  ManagerConfig config_;
  mutable absl::Mutex mutex_;
  std::map<std::string, proto::LanguageTemplate> templates_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace manager

#endif
