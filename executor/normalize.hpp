#ifndef EXECUTOR_NORMALIZE_HPP
#define EXECUTOR_NORMALIZE_HPP

#include <map>
#include <string>

#include "proto/sandbox.pb.h"

namespace executor {

// Entry file derived from a code snippet.
struct EntryFile {
  std::string name;
  std::string content;
  // Variables the command template needs to run the file.
  std::map<std::string, std::string> env;
};

// Adds the boilerplate a bare snippet lacks to run as a program in the
// language of tmpl: a package clause for go, a main function for rust,
// standard includes for c and cpp, a Main class for java. Detection is a
// plain text search, so code that already looks complete is left alone. For
// java the entry file is named after the public class, which is exported as
// CODEBOX_JAVA_CLASS.
EntryFile NormalizeEntryFile(const proto::LanguageTemplate& tmpl,
                             const std::string& code);

}  // namespace executor

#endif
