#ifndef MANAGER_LANGUAGE_HPP
#define MANAGER_LANGUAGE_HPP

#include <map>
#include <string>

#include "proto/sandbox.pb.h"

namespace manager {

// Placeholder of a command template token that is replaced by the entry file.
static const constexpr char* kFilePlaceholder = "{{file}}";
static const constexpr char* kDefaultWorkDir = "/workspace";
static const constexpr char* kDefaultFileName = "main.txt";

// Trims and lowercases a language name and resolves the aliases: js, node and
// nodejs are javascript, ts is typescript, py and python3 are python, golang
// is go and c++ is cpp.
std::string CanonicalLanguage(const std::string& language);

// Canonicalizes the language key and fills in the default working directory.
proto::LanguageTemplate NormalizeTemplate(proto::LanguageTemplate tmpl);

// Built-in recipes for python, javascript, typescript, go, rust, java, c and
// cpp, keyed by canonical language.
std::map<std::string, proto::LanguageTemplate> DefaultTemplates();

// 512 MiB, 1 cpu, 128 pids, 45 seconds, 1 MiB of output.
proto::ResourceQuota DefaultQuota();

// Per-language overrides of DefaultQuota.
std::map<std::string, proto::ResourceQuota> DefaultLanguageQuotas();

// Overlays the positive fields of override on base.
proto::ResourceQuota MergeQuota(proto::ResourceQuota base,
                                const proto::ResourceQuota& override);

}  // namespace manager

#endif
