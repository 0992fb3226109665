#include "executor/workspace.hpp"

#include "executor/errors.hpp"
#include "glog/logging.h"
#include "manager/language.hpp"
#include "util/file.hpp"

namespace executor {

StagedFiles PrepareFiles(const proto::LanguageTemplate& tmpl,
                         const proto::ExecuteRequest& request) {
  StagedFiles staged;
  for (const auto& kv : request.files()) {
    std::string clean;
    if (!util::File::CleanRelativePath(kv.first, &clean)) {
      throw invalid_request("invalid file path in request: " + kv.first);
    }
    staged.files[clean] = kv.second;
  }
  staged.entry_name = tmpl.file_name().empty() ? manager::kDefaultFileName
                                               : tmpl.file_name();
  if (!request.code().empty()) {
    EntryFile entry = NormalizeEntryFile(tmpl, request.code());
    staged.entry_name = entry.name;
    staged.env = std::move(entry.env);
    staged.files[staged.entry_name] = std::move(entry.content);
  }
  if (staged.files.empty()) {
    throw invalid_request("no code or files provided");
  }
  return staged;
}

Workspace::Workspace(const std::string& project_root, const std::string& id,
                     bool keep)
    : path_(util::File::JoinPath(project_root, id)), keep_(keep) {
  try {
    util::File::MakeDirs(project_root);
    util::File::MakeDir(path_);
  } catch (const util::file_exists&) {
    throw invalid_request("execution " + id + " is already running");
  } catch (const std::system_error& e) {
    throw infrastructure_error(std::string("create workspace: ") + e.what());
  }
  VLOG(1) << "Created workspace " << path_;
}

void Workspace::Write(const StagedFiles& staged) {
  for (const auto& kv : staged.files) {
    try {
      util::File::Write(util::File::JoinPath(path_, kv.first), kv.second,
                        /*overwrite=*/true);
    } catch (const std::system_error& e) {
      throw infrastructure_error("write " + kv.first + ": " + e.what());
    }
  }
}

Workspace::~Workspace() {
  if (keep_) {
    LOG(INFO) << "Keeping workspace " << path_;
    return;
  }
  try {
    util::File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Could not remove workspace " << path_ << ": "
                 << e.what();
  }
}

}  // namespace executor
