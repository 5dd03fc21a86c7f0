#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <system_error>

#include "absl/strings/string_view.h"

namespace util {

class File {
 public:
  // Reads at most max_bytes of the file specified by path. A negative
  // max_bytes reads the whole file. Throws std::system_error on failure.
  static std::string Contents(const std::string& path, int64_t max_bytes = -1);

  // Writes content to path, going through a temporary file in the same folder
  // so that readers never see a partial file.
  static void Write(const std::string& path, absl::string_view content);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
