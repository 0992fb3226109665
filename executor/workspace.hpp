#ifndef EXECUTOR_WORKSPACE_HPP
#define EXECUTOR_WORKSPACE_HPP

#include <map>
#include <string>

#include "executor/normalize.hpp"
#include "proto/sandbox.pb.h"

namespace executor {

// Files of a request, with cleaned relative paths.
struct StagedFiles {
  // Relative path -> content, including the entry file.
  std::map<std::string, std::string> files;
  // Name the command template refers to as {{file}}.
  std::string entry_name;
  // Variables derived from the entry file.
  std::map<std::string, std::string> env;
};

// Merges the auxiliary files of the request with the normalized entry file,
// which wins over an auxiliary file of the same name. Throws invalid_request
// if there is nothing to run or if a path is absolute, empty, or escapes the
// workspace.
StagedFiles PrepareFiles(const proto::LanguageTemplate& tmpl,
                         const proto::ExecuteRequest& request);

// Directory owned by a single execution, removed on destruction.
class Workspace {
 public:
  // Creates <project_root>/<id>. Throws invalid_request if another execution
  // owns the directory and infrastructure_error if it cannot be created.
  Workspace(const std::string& project_root, const std::string& id,
            bool keep = false);
  ~Workspace();

  const std::string& Path() const { return path_; }

  // Throws infrastructure_error on failure.
  void Write(const StagedFiles& staged);

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  Workspace(Workspace&&) = delete;
  Workspace& operator=(Workspace&&) = delete;

 private:
  std::string path_;
  bool keep_;
};

}  // namespace executor

#endif
