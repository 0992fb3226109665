#include "executor/normalize.hpp"

#include <functional>
#include <regex>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "manager/language.hpp"

namespace executor {

namespace {

using Rule = std::function<void(EntryFile*)>;

Rule PrependUnless(const std::string& marker, const std::string& prefix) {
  return [marker, prefix](EntryFile* entry) {
    if (!absl::StrContains(entry->content, marker)) {
      entry->content = prefix + entry->content;
    }
  };
}

Rule WrapUnless(const std::string& marker, const std::string& prefix,
                const std::string& suffix) {
  return [marker, prefix, suffix](EntryFile* entry) {
    if (!absl::StrContains(entry->content, marker)) {
      entry->content = prefix + entry->content + suffix;
    }
  };
}

std::string IndentJava(const std::string& code) {
  std::vector<std::string> lines = absl::StrSplit(code, '\n');
  for (std::string& line : lines) {
    if (absl::StripAsciiWhitespace(line).empty()) {
      line.clear();
    } else {
      line = "    " + line;
    }
  }
  return absl::StrJoin(lines, "\n");
}

void NormalizeJava(EntryFile* entry) {
  static const std::regex public_class(
      "public\\s+class\\s+([A-Za-z_][A-Za-z0-9_]*)");
  std::string class_name = "Main";
  std::smatch match;
  if (std::regex_search(entry->content, match, public_class)) {
    class_name = match[1].str();
  } else if (!absl::StrContains(entry->content, "class Main")) {
    entry->content =
        "public class Main {\n  public static void main(String[] args) {\n" +
        IndentJava(entry->content) + "\n  }\n}\n";
  }
  entry->name = class_name + ".java";
  entry->env["CODEBOX_JAVA_CLASS"] = class_name;
}

const std::map<std::string, Rule>& Rules() {
  static const std::map<std::string, Rule>* rules =
      new std::map<std::string, Rule>{
          {"go", PrependUnless("package ", "package main\n\n")},
          {"rust", WrapUnless("fn main", "fn main() {\n", "\n}\n")},
          {"c", PrependUnless("#include",
                              "#include <stdio.h>\n#include <stdlib.h>\n\n")},
          {"cpp", PrependUnless("#include",
                                "#include <iostream>\nusing namespace std;\n\n")},
          {"java", NormalizeJava},
      };
  return *rules;
}

}  // namespace

EntryFile NormalizeEntryFile(const proto::LanguageTemplate& tmpl,
                             const std::string& code) {
  EntryFile entry;
  entry.name = tmpl.file_name().empty() ? manager::kDefaultFileName
                                        : tmpl.file_name();
  entry.content = code;
  auto rule = Rules().find(manager::CanonicalLanguage(tmpl.language()));
  if (rule != Rules().end()) rule->second(&entry);
  return entry;
}

}  // namespace executor
