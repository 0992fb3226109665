#include "manager/manager.hpp"

#include <stdexcept>

#include "glog/logging.h"
#include "manager/language.hpp"
#include "util/file.hpp"
#include "util/id.hpp"

namespace manager {

Manager::Manager(ManagerConfig config) : config_(std::move(config)) {
  if (config_.workspace_root.empty()) {
    throw std::invalid_argument("workspace root is required");
  }
  util::File::MakeDirs(config_.workspace_root);
  if (config_.enable_package_cache) {
    if (config_.package_cache_root.empty()) {
      throw std::invalid_argument("package cache root is required");
    }
    util::File::MakeDirs(config_.package_cache_root);
  }
  std::map<std::string, proto::ResourceQuota> quotas;
  for (const auto& kv : config_.language_quotas) {
    quotas[CanonicalLanguage(kv.first)] = kv.second;
  }
  config_.language_quotas = std::move(quotas);
  for (const auto& kv : config_.templates) {
    proto::LanguageTemplate tmpl = kv.second;
    if (tmpl.language().empty()) tmpl.set_language(kv.first);
    tmpl = NormalizeTemplate(std::move(tmpl));
    templates_[tmpl.language()] = std::move(tmpl);
  }
  LOG(INFO) << "Sandbox manager ready: " << templates_.size()
            << " languages, workspaces in " << config_.workspace_root;
}

absl::optional<proto::LanguageTemplate> Manager::GetTemplate(
    const std::string& language) const {
  absl::MutexLock lock(&mutex_);
  auto it = templates_.find(CanonicalLanguage(language));
  if (it == templates_.end()) return absl::nullopt;
  return it->second;
}

void Manager::RegisterTemplate(const proto::LanguageTemplate& tmpl) {
  proto::LanguageTemplate normalized = NormalizeTemplate(tmpl);
  VLOG(1) << "Registering template for " << normalized.language();
  absl::MutexLock lock(&mutex_);
  std::string key = normalized.language();
  templates_[key] = std::move(normalized);
}

std::vector<proto::LanguageTemplate> Manager::Templates() const {
  absl::MutexLock lock(&mutex_);
  std::vector<proto::LanguageTemplate> result;
  for (const auto& kv : templates_) result.push_back(kv.second);
  return result;
}

proto::ResourceQuota Manager::EffectiveQuota(
    const std::string& language) const {
  // The built-in default fills whatever the configured default leaves unset.
  proto::ResourceQuota quota = MergeQuota(DefaultQuota(), config_.default_quota);
  auto it = config_.language_quotas.find(CanonicalLanguage(language));
  if (it != config_.language_quotas.end()) {
    quota = MergeQuota(quota, it->second);
  }
  return quota;
}

std::string Manager::WorkspaceRootForProject(
    const std::string& project_id) const {
  std::string project = util::SanitizeId(project_id);
  if (project.empty()) project = "anonymous";
  return util::File::JoinPath(config_.workspace_root, project);
}

std::string Manager::PackageCachePath(const std::string& project_id,
                                      const std::string& cache_name) const {
  if (!config_.enable_package_cache) return "";
  std::string project = util::SanitizeId(project_id);
  if (project.empty()) project = "shared";
  std::string cache = util::SanitizeId(cache_name);
  if (cache.empty()) throw std::invalid_argument("invalid cache name");
  std::string path = util::File::JoinPath(
      util::File::JoinPath(config_.package_cache_root, project), cache);
  util::File::MakeDirs(path);
  return path;
}

}  // namespace manager
