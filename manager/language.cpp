#include "manager/language.hpp"

#include <utility>
#include <vector>

#include "absl/strings/ascii.h"

namespace manager {

namespace {

const int64_t kMiB = 1024 * 1024;
const int64_t kSecond = 1000;

struct CacheMount {
  const char* name;
  const char* container_path;
  const char* env;
};

proto::LanguageTemplate MakeTemplate(
    const std::string& language, const std::string& file_name,
    const std::string& image, const std::vector<std::string>& command,
    const std::vector<std::pair<std::string, std::string>>& env,
    const std::vector<CacheMount>& cache_mounts) {
  proto::LanguageTemplate tmpl;
  tmpl.set_language(language);
  tmpl.set_file_name(file_name);
  tmpl.set_image(image);
  tmpl.set_work_dir(kDefaultWorkDir);
  for (const std::string& token : command) tmpl.add_command_template(token);
  for (const auto& kv : env) (*tmpl.mutable_env())[kv.first] = kv.second;
  for (const CacheMount& mount : cache_mounts) {
    proto::CacheMountSpec* spec = tmpl.add_cache_mounts();
    spec->set_name(mount.name);
    spec->set_container_path(mount.container_path);
    (*spec->mutable_env())[mount.env] = mount.container_path;
  }
  return tmpl;
}

proto::ResourceQuota MakeQuota(int64_t memory_mib, double cpu_cores,
                               int64_t pids, int64_t timeout_seconds) {
  proto::ResourceQuota quota;
  quota.set_memory_bytes(memory_mib * kMiB);
  quota.set_cpu_cores(cpu_cores);
  quota.set_pids_limit(pids);
  quota.set_timeout_ms(timeout_seconds * kSecond);
  quota.set_max_output_bytes(kMiB);
  return quota;
}

}  // namespace

std::string CanonicalLanguage(const std::string& language) {
  std::string lang =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(language));
  if (lang == "js" || lang == "node" || lang == "nodejs") return "javascript";
  if (lang == "ts") return "typescript";
  if (lang == "py" || lang == "python3") return "python";
  if (lang == "golang") return "go";
  if (lang == "c++") return "cpp";
  return lang;
}

proto::LanguageTemplate NormalizeTemplate(proto::LanguageTemplate tmpl) {
  tmpl.set_language(CanonicalLanguage(tmpl.language()));
  if (tmpl.work_dir().empty()) tmpl.set_work_dir(kDefaultWorkDir);
  return tmpl;
}

std::map<std::string, proto::LanguageTemplate> DefaultTemplates() {
  const CacheMount npm{"npm", "/cache/npm", "NPM_CONFIG_CACHE"};
  std::vector<proto::LanguageTemplate> templates = {
      MakeTemplate("python", "main.py", "python:3.12-slim-bookworm",
                   {"python3", "-u", kFilePlaceholder},
                   {{"PYTHONDONTWRITEBYTECODE", "1"},
                    {"PYTHONUNBUFFERED", "1"},
                    {"PIP_DISABLE_PIP_VERSION_CHECK", "1"}},
                   {{"pip", "/cache/pip", "PIP_CACHE_DIR"}}),
      MakeTemplate("javascript", "main.js", "node:20-slim",
                   {"node", kFilePlaceholder}, {{"NODE_ENV", "production"}},
                   {npm}),
      MakeTemplate("typescript", "main.ts", "node:20-slim",
                   {"sh", "-lc",
                    "npm --yes --cache /cache/npm exec tsx {{file}}"},
                   {{"NODE_ENV", "production"}}, {npm}),
      MakeTemplate("go", "main.go", "golang:1.22-bookworm",
                   {"sh", "-lc", "go run {{file}}"}, {{"CGO_ENABLED", "0"}},
                   {{"go-build", "/cache/go-build", "GOCACHE"},
                    {"go-mod", "/cache/go-mod", "GOMODCACHE"}}),
      MakeTemplate("rust", "main.rs", "rust:1.75-slim-bookworm",
                   {"sh", "-lc", "rustc {{file}} -O -o /tmp/main && /tmp/main"},
                   {},
                   {{"cargo-home", "/cache/cargo-home", "CARGO_HOME"},
                    {"cargo-target", "/cache/cargo-target",
                     "CARGO_TARGET_DIR"}}),
      MakeTemplate("java", "Main.java", "eclipse-temurin:21-jdk-jammy",
                   {"sh", "-lc",
                    "javac {{file}} && java ${CODEBOX_JAVA_CLASS:-Main}"},
                   {}, {{"m2", "/cache/m2", "MAVEN_CONFIG"}}),
      MakeTemplate("c", "main.c", "gcc:13-bookworm",
                   {"sh", "-lc",
                    "gcc -O2 {{file}} -o /tmp/main -lm && /tmp/main"},
                   {}, {}),
      MakeTemplate("cpp", "main.cpp", "gcc:13-bookworm",
                   {"sh", "-lc",
                    "g++ -O2 -std=c++17 {{file}} -o /tmp/main && /tmp/main"},
                   {}, {}),
  };
  std::map<std::string, proto::LanguageTemplate> result;
  for (proto::LanguageTemplate& tmpl : templates) {
    std::string key = tmpl.language();
    result[key] = std::move(tmpl);
  }
  return result;
}

proto::ResourceQuota DefaultQuota() { return MakeQuota(512, 1.0, 128, 45); }

std::map<std::string, proto::ResourceQuota> DefaultLanguageQuotas() {
  return {
      {"python", MakeQuota(256, 0.5, 64, 30)},
      {"javascript", MakeQuota(256, 0.75, 96, 30)},
      {"typescript", MakeQuota(512, 1.0, 128, 45)},
      {"go", MakeQuota(768, 1.5, 192, 60)},
      {"rust", MakeQuota(1024, 2.0, 256, 90)},
      {"java", MakeQuota(1024, 1.5, 256, 90)},
      {"c", MakeQuota(384, 1.0, 128, 45)},
      {"cpp", MakeQuota(512, 1.25, 160, 60)},
  };
}

proto::ResourceQuota MergeQuota(proto::ResourceQuota base,
                                const proto::ResourceQuota& override) {
  if (override.memory_bytes() > 0)
    base.set_memory_bytes(override.memory_bytes());
  if (override.cpu_cores() > 0) base.set_cpu_cores(override.cpu_cores());
  if (override.pids_limit() > 0) base.set_pids_limit(override.pids_limit());
  if (override.timeout_ms() > 0) base.set_timeout_ms(override.timeout_ms());
  if (override.max_output_bytes() > 0)
    base.set_max_output_bytes(override.max_output_bytes());
  return base;
}

}  // namespace manager
