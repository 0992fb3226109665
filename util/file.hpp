#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <system_error>
#include <string>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class File {
 public:
  // Reads the whole content of the file specified by path.
  static std::string Read(const std::string& path);

  // Writes content to path, creating the missing parent folders. The file is
  // written to a temporary name first and then moved in place.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Creates exactly one new directory; throws file_exists if it is already
  // there. Parents must exist.
  static void MakeDir(const std::string& path);

  // Recursively removes a tree. A missing tree is not an error.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path);

  // Lexically cleans a relative path: empty and "." components are dropped
  // and ".." removes the previous component. Returns false if the path is
  // absolute, contains a NUL byte, refers to the root itself or climbs out
  // of it.
  static bool CleanRelativePath(const std::string& path, std::string* clean);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
